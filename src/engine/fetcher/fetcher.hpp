#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "../../core/types/error_kind.hpp"
#include "../../network/http/http_client.hpp"

namespace Clawweb {
namespace Engine {

struct FetchResult {
    Core::ErrorKind          kind = Core::ErrorKind::None;
    std::string              error;
    long                     status_code = 0;
    std::string              content_type;
    std::vector<std::string> links;

    bool ok() const {
        return kind == Core::ErrorKind::None;
    }
};

// Retrieves a single page and collects its outbound links. One instance per
// page; relative hrefs resolve against the requested URL even when the
// transport followed a redirect.
class Fetcher {
public:
    Fetcher(Network::Http::HttpClient& client, std::string url);

    const FetchResult&              fetch();
    const std::string&              url() const;
    const std::vector<std::string>& links() const;

    static std::string media_type(const std::string& content_type);

private:
    Network::Http::HttpClient& client_;
    std::string                url_;
    FetchResult                result_;
    bool                       fetched_ = false;

    void add_link(std::string link);
};

// Fetches one page and writes every outbound link containing "http" as
// "N. link", numbered from 1. Returns the number of lines written.
int print_links(Network::Http::HttpClient& client, const std::string& url, std::ostream& out);

}  // namespace Engine
}  // namespace Clawweb
