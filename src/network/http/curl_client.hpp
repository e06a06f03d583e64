#pragma once
#include "http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

namespace Clawweb {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_timeout(long seconds) override;
    void     set_user_agent(const std::string& user_agent) override;
    Response get(const std::string& url) override;

private:
    struct Request {
        std::string url;
        long        timeout_seconds = 10;
        bool        follow_location = true;
        long        max_redirects   = 10;
        std::string user_agent;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    long                               timeout_seconds_;
    std::string                        user_agent_;

    Response create_error_response(const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const Request& req, std::string& body) const;
    Response handle_response(CURL* curl, CURLcode res, const Request& req, std::string& body) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Clawweb
