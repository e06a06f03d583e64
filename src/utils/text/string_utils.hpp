#pragma once

#include <string>
#include <vector>

namespace Clawweb {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        contains(const std::string& str, const std::string& needle);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Escapes &, <, >, " and ' as HTML character references.
std::string escape_html(const std::string& str);

// Returns valid UTF-8. Each maximal ill-formed subsequence becomes U+FFFD.
std::string sanitize_utf8(const std::string& bytes);

}  // namespace Text
}  // namespace Utils
}  // namespace Clawweb
