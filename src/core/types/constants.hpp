#pragma once
#include <string>

namespace Clawweb {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_DEPTH   = 30;
    static constexpr int         DEFAULT_THREADS = 1;
    static constexpr const char* VERSION         = "0.1.0";

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr const char* USER_AGENT              = "Clawweb/0.1";

    static constexpr const char* HTML_MIME_TYPE    = "text/html";
    static constexpr const char* DEFAULT_MIME_TYPE = "text/plain";
    static constexpr const char* LINK_TYPE_HREF    = "href";

    // Substring a links-mode result must contain to be printed.
    static constexpr const char* LINKS_MODE_MARKER = "http";
};

}  // namespace Core
}  // namespace Clawweb
