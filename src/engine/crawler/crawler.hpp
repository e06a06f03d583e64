#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../core/types/error_kind.hpp"
#include "../../network/http/http_client.hpp"
#include "../fetcher/fetcher.hpp"
#include "../filter/filter.hpp"
#include "link.hpp"

namespace Clawweb {
namespace Engine {

using namespace Clawweb::Network::Http;

struct CrawlerConfig {
    std::string                root;
    int                        depth_limit = Core::Constants::DEFAULT_DEPTH;
    std::optional<std::string> confine_prefix;
    std::vector<std::string>   exclude_prefixes;
    bool                       host_locked = true;
    // When false every discovered link is recorded, in scope or not.
    bool        filter_reported = true;
    int         threads         = Core::Constants::DEFAULT_THREADS;
    long        timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS;
    std::string user_agent      = Core::Constants::USER_AGENT;
};

struct FrontierItem {
    std::string url;
    int         depth = 0;
};

struct CrawlStats {
    int                            followed = 0;
    int                            links    = 0;
    std::map<Core::ErrorKind, int> failures;
};

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

using LinkSet = std::unordered_set<Link, LinkHash>;

// Breadth-first traversal of one host. An instance performs exactly one crawl.
class Crawler {
public:
    explicit Crawler(CrawlerConfig config);
    Crawler(CrawlerConfig config, ClientFactory client_factory);

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    void crawl();

    int                                    num_links() const;
    int                                    num_followed() const;
    const std::string&                     host() const;
    const LinkSet&                         links_remembered() const;
    const std::unordered_set<std::string>& urls_remembered() const;
    const std::unordered_set<std::string>& urls_seen() const;
    const std::unordered_set<std::string>& visited_links() const;
    const std::vector<std::string>&        visit_order() const;
    const CrawlStats&                      stats() const;

private:
    struct Task {
        FrontierItem item;
        FetchResult  result;
    };

    CrawlerConfig config_;
    ClientFactory client_factory_;
    std::string   host_;
    bool          started_ = false;

    std::queue<FrontierItem> frontier_;

    std::unordered_set<std::string> urls_seen_;
    std::unordered_set<std::string> visited_links_;
    std::unordered_set<std::string> urls_remembered_;
    LinkSet                         links_remembered_;
    std::vector<std::string>        visit_order_;

    int        num_links_    = 0;
    int        num_followed_ = 0;
    CrawlStats stats_;

    FilterPipeline follow_filters_;
    FilterPipeline report_filters_;

    void build_pipelines();

    std::vector<FrontierItem> next_batch();
    bool                      admit(const FrontierItem& item);
    void                      fetch_all(std::vector<Task>& tasks);
    FetchResult               fetch_one(const std::string& url);
    void                      process_links(const Task& task);
    void                      remember(const std::string& src, const std::string& dst);
    void                      record_failure(Core::ErrorKind kind);
};

}  // namespace Engine
}  // namespace Clawweb
