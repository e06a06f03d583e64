#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/fetcher/fetcher.hpp"
#include "network/http/curl_client.hpp"

using namespace Clawweb;

namespace {

Engine::CrawlerConfig to_crawler_config(const Core::Config& config) {
    Engine::CrawlerConfig crawler_config;
    crawler_config.root             = config.url;
    crawler_config.depth_limit      = config.depth;
    crawler_config.exclude_prefixes = config.exclude;
    crawler_config.threads          = config.threads;
    crawler_config.timeout_seconds  = config.timeout;
    crawler_config.user_agent       = config.user_agent;
    if (!config.confine.empty())
        crawler_config.confine_prefix = config.confine;
    return crawler_config;
}

int run_links(const Core::Config& config) {
    Network::Http::CurlClient client;
    client.set_timeout(config.timeout);
    client.set_user_agent(config.user_agent);
    Engine::print_links(client, config.url, std::cout);
    return 0;
}

int run_crawler(const Core::Config& config) {
    std::cerr << "Crawling " << config.url << " (Max Depth: " << config.depth << ")" << std::endl;

    Engine::Crawler crawler(to_crawler_config(config));
    crawler.crawl();

    std::cerr << "Found:    " << crawler.num_links() << std::endl;
    std::cerr << "Followed: " << crawler.num_followed() << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::runtime_error& e) {
        Core::Logger::error(e.what());
        Core::Config::print_usage(std::cerr);
        return 1;
    }

    if (config.show_help) {
        Core::Config::print_usage(std::cout);
        return 0;
    }

    if (config.url.empty()) {
        Core::Config::print_usage(std::cerr);
        return 1;
    }

    Core::Logger::set_level(config.verbose ? Core::LOG_ALL : Core::LOG_WARN | Core::LOG_ERROR);

    curl_global_init(CURL_GLOBAL_ALL);
    int code = 1;
    try {
        code = config.links_only ? run_links(config) : run_crawler(config);
    } catch (const std::invalid_argument& e) {
        Core::Logger::error(e.what());
    }
    curl_global_cleanup();

    return code;
}
