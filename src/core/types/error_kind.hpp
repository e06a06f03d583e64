#pragma once
#include <string>

namespace Clawweb {
namespace Core {

enum class ErrorKind { None, NonHtmlContent, Transport, HostResolution, Unhandled };

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NonHtmlContent: return "non-html content";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::HostResolution: return "host resolution error";
        case ErrorKind::Unhandled: return "unhandled page error";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Clawweb
