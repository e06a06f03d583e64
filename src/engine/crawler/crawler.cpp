#include "crawler.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Clawweb {
namespace Engine {

using namespace Clawweb::Core;
using namespace Clawweb::Utils;

namespace {

ClientFactory curl_factory(long timeout_seconds, std::string user_agent) {
    return [timeout_seconds, user_agent = std::move(user_agent)]() {
        std::unique_ptr<HttpClient> client = std::make_unique<CurlClient>();
        client->set_timeout(timeout_seconds);
        client->set_user_agent(user_agent);
        return client;
    };
}

}  // namespace

Crawler::Crawler(CrawlerConfig config)
    : Crawler(config, curl_factory(config.timeout_seconds, config.user_agent)) {
}

Crawler::Crawler(CrawlerConfig config, ClientFactory client_factory)
    : config_(std::move(config)), client_factory_(std::move(client_factory)) {
    auto host = Url::hostname(config_.root);
    if (!host) {
        throw std::invalid_argument("Invalid root URL '" + config_.root + "' ("
                                    + Url::parse(config_.root).error + ")");
    }
    host_ = *host;

    if (config_.threads < 1)
        config_.threads = 1;

    build_pipelines();
}

void Crawler::build_pipelines() {
    follow_filters_.add(std::make_unique<PrefixFilter>(config_.confine_prefix));
    follow_filters_.add(std::make_unique<ExclusionFilter>(config_.exclude_prefixes));
    follow_filters_.add(std::make_unique<VisitedFilter>(visited_links_));
    if (config_.host_locked)
        follow_filters_.add(std::make_unique<HostFilter>(host_));

    if (!config_.filter_reported)
        return;

    report_filters_.add(std::make_unique<PrefixFilter>(config_.confine_prefix));
    if (config_.host_locked)
        report_filters_.add(std::make_unique<HostFilter>(host_));
}

void Crawler::crawl() {
    if (started_)
        throw std::logic_error("Crawler instances perform a single crawl");
    started_ = true;

    Logger::info("Crawler: Starting for " + config_.root + " (host " + host_ + ")");
    frontier_.push({config_.root, 0});

    while (!frontier_.empty()) {
        std::vector<Task> tasks;
        for (auto& item : next_batch()) {
            if (item.depth > config_.depth_limit)
                continue;
            if (admit(item))
                tasks.push_back({std::move(item), FetchResult{}});
        }

        fetch_all(tasks);

        for (const auto& task : tasks) {
            try {
                process_links(task);
            } catch (const std::exception& e) {
                record_failure(ErrorKind::Unhandled);
                Logger::error("Can't process url '" + task.item.url + "' (" + e.what() + ")");
            }
        }
    }

    stats_.followed = num_followed_;
    stats_.links    = num_links_;
    Logger::success("Crawler: Finished. Followed " + std::to_string(num_followed_) + ", found "
                    + std::to_string(num_links_));
    for (const auto& [kind, count] : stats_.failures)
        Logger::info("Crawler: " + std::to_string(count) + " x " + Core::to_string(kind));
}

// Sequential runs take one item at a time. Pooled runs take the whole level
// at the head of the queue, which holds every item of that depth because
// children are only ever enqueued one level deeper.
std::vector<FrontierItem> Crawler::next_batch() {
    std::vector<FrontierItem> batch;
    const int                 level = frontier_.front().depth;
    while (!frontier_.empty() && frontier_.front().depth == level) {
        batch.push_back(std::move(frontier_.front()));
        frontier_.pop();
        if (config_.threads == 1)
            break;
    }
    return batch;
}

bool Crawler::admit(const FrontierItem& item) {
    PipelineResult verdict;
    try {
        verdict = follow_filters_.evaluate(item.url);
    } catch (const std::exception& e) {
        record_failure(ErrorKind::Unhandled);
        Logger::error("Can't process url '" + item.url + "' (" + e.what() + ")");
        return false;
    }

    if (verdict.kind != ErrorKind::None)
        record_failure(verdict.kind);

    if (!verdict.passed) {
        if (item.depth == 0) {
            Logger::warn("Whoops! Starting URL " + item.url
                         + " rejected by the following filters: "
                         + Text::join(verdict.rejected_by, ", "));
        }
        return false;
    }

    visited_links_.insert(item.url);
    visit_order_.push_back(item.url);
    ++num_followed_;
    return true;
}

FetchResult Crawler::fetch_one(const std::string& url) {
    try {
        auto    client = client_factory_();
        Fetcher fetcher(*client, url);
        return fetcher.fetch();
    } catch (const std::exception& e) {
        FetchResult result;
        result.kind  = ErrorKind::Unhandled;
        result.error = e.what();
        Logger::error("Can't process url '" + url + "' (" + e.what() + ")");
        return result;
    }
}

void Crawler::fetch_all(std::vector<Task>& tasks) {
    if (tasks.empty())
        return;

    if (config_.threads == 1 || tasks.size() == 1) {
        for (auto& task : tasks)
            task.result = fetch_one(task.item.url);
    }
    else {
        // Each task owns its result slot, so workers never share state.
        size_t workers = std::min(tasks.size(), static_cast<size_t>(config_.threads));
        boost::asio::thread_pool pool(workers);
        for (auto& task : tasks) {
            boost::asio::post(pool, [this, &task]() { task.result = fetch_one(task.item.url); });
        }
        pool.join();
    }

    for (const auto& task : tasks) {
        if (!task.result.ok())
            record_failure(task.result.kind);
    }
}

void Crawler::process_links(const Task& task) {
    for (const auto& raw : task.result.links) {
        std::string link_url = Url::normalize(raw);

        if (urls_seen_.insert(link_url).second) {
            frontier_.push({link_url, task.item.depth + 1});
        }

        PipelineResult verdict = report_filters_.evaluate(link_url);
        if (verdict.kind != ErrorKind::None)
            record_failure(verdict.kind);
        if (verdict.passed)
            remember(task.item.url, link_url);
    }
}

void Crawler::remember(const std::string& src, const std::string& dst) {
    ++num_links_;
    urls_remembered_.insert(dst);
    links_remembered_.insert(Link{src, dst, Constants::LINK_TYPE_HREF});
}

void Crawler::record_failure(ErrorKind kind) {
    ++stats_.failures[kind];
}

int Crawler::num_links() const {
    return num_links_;
}

int Crawler::num_followed() const {
    return num_followed_;
}

const std::string& Crawler::host() const {
    return host_;
}

const LinkSet& Crawler::links_remembered() const {
    return links_remembered_;
}

const std::unordered_set<std::string>& Crawler::urls_remembered() const {
    return urls_remembered_;
}

const std::unordered_set<std::string>& Crawler::urls_seen() const {
    return urls_seen_;
}

const std::unordered_set<std::string>& Crawler::visited_links() const {
    return visited_links_;
}

const std::vector<std::string>& Crawler::visit_order() const {
    return visit_order_;
}

const CrawlStats& Crawler::stats() const {
    return stats_;
}

}  // namespace Engine
}  // namespace Clawweb
