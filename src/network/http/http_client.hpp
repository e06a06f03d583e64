#pragma once

#include <string>

namespace Clawweb {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Http };

enum class HTTPCode { Ok = 200, NetworkError = 0 };

enum class MaxCode { ClientError = 400 };

}  // namespace Http
}  // namespace Network
}  // namespace Clawweb

namespace Clawweb {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

// One blocking GET per call. Redirects are followed by the implementation.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_timeout(long /*seconds*/) {}
    virtual void     set_user_agent(const std::string& /*user_agent*/) {}
    virtual Response get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Clawweb
