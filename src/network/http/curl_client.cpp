#include "curl_client.hpp"
#include <string>
#include "../../core/types/constants.hpp"

namespace Clawweb {
namespace Network {
namespace Http {

namespace {

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    if (!body)
        return 0;

    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      timeout_seconds_(Core::Constants::REQUEST_TIMEOUT_SECONDS),
      user_agent_(Core::Constants::USER_AGENT) {
}

void CurlClient::set_timeout(long seconds) {
    timeout_seconds_ = seconds;
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Network;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL* curl, const Request& req, std::string& body) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, req.max_redirects);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (req.timeout_seconds > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);
    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());
}

Response CurlClient::handle_response(CURL*          curl,
                                     CURLcode       res,
                                     const Request& req,
                                     std::string&   body) const {
    if (res != CURLE_OK) {
        Response response      = create_error_response(curl_easy_strerror(res));
        response.error_type    = map_curl_code_to_error_type(res);
        response.effective_url = req.url;
        return response;
    }

    Response response;

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = status;

    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    response.effective_url = eff_url_ptr ? std::string(eff_url_ptr) : req.url;

    // Content-Type of the final response only, not of intermediate redirects.
    char* content_type_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type_ptr);
    if (content_type_ptr)
        response.content_type = content_type_ptr;

    response.body    = std::move(body);
    response.success = (response.status_code >= static_cast<long>(HTTPCode::Ok)
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success) {
        response.error      = "HTTP Error " + std::to_string(response.status_code);
        response.error_type = ErrorType::Http;
    }
    return response;
}

Response CurlClient::get(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    Request req;
    req.url             = url;
    req.timeout_seconds = timeout_seconds_;
    req.user_agent      = user_agent_;

    std::string body;
    setup_curl_options(curl_.get(), req, body);
    CURLcode res = curl_easy_perform(curl_.get());
    return handle_response(curl_.get(), res, req, body);
}

}  // namespace Http
}  // namespace Network
}  // namespace Clawweb
