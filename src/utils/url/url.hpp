#pragma once
#include <optional>
#include <string>

namespace Clawweb {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string start_url;
    bool        valid = true;
    std::string error;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // Lowercase host with IPv6 brackets and port removed. Empty when the URL
    // has no authority, nullopt when the authority cannot be parsed.
    static std::optional<std::string> hostname(const std::string& url);

    // RFC 3986 section 5.2 merge for relative references. A reference with its
    // own authority, or in a scheme other than the base's, is kept as written.
    static std::string resolve(const std::string& base, const std::string& relative);

    // Drops the fragment so that "page#a" and "page#b" share one frontier entry.
    static std::string normalize(const std::string& url);
};

}  // namespace Utils
}  // namespace Clawweb
