#pragma once
#include <string>
#include <vector>

namespace Clawweb {
namespace Utils {
namespace Html {

class HtmlParser {
public:
    // href values of every <a> element in document order. Anchors without an
    // href attribute are skipped; empty hrefs are kept.
    static std::vector<std::string> extract_links(const std::string& html);
};

}  // namespace Html
}  // namespace Utils
}  // namespace Clawweb
