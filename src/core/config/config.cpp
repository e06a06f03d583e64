#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Clawweb {
namespace Core {

namespace {

void define_options(CLI::App& app, Config& config) {
    app.add_flag("-l,--links", config.links_only, "Get links for specified url only");
    app.add_option("-d,--depth", config.depth, "Maximum depth to traverse");
    app.add_option("--confine", config.confine, "Only follow and report URLs with this prefix");
    app.add_option("--exclude", config.exclude, "Never follow URLs with this prefix");
    app.add_option("-t,--threads", config.threads, "Concurrent fetches per BFS level")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", config.timeout, "Per-request timeout in seconds");
    app.add_option("--user-agent", config.user_agent, "User-Agent header");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("-v,--verbose", config.verbose, "Log progress information");
    app.add_option("url", config.url, "Root URL to crawl");
    app.allow_extras();
}

// Trailing positional arguments are ignored, unknown options are not.
void check_extras(const CLI::App& app) {
    std::vector<std::string> unknown;
    for (const auto& arg : app.remaining()) {
        if (Utils::Text::starts_with(arg, "-"))
            unknown.push_back(arg);
    }
    if (!unknown.empty())
        throw CLI::ExtrasError(unknown);
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["confine"])
            config.confine = yaml["confine"].as<std::string>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<long>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();

        if (yaml["exclude"] && yaml["exclude"].IsSequence()) {
            for (const auto& node : yaml["exclude"])
                config.exclude.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }

    if (config.threads < 1)
        throw std::runtime_error("Error parsing config file: threads must be positive");
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"clawweb - single-host breadth-first web crawler"};
    define_options(app, config);

    try {
        app.parse(argc, argv);
        check_extras(app);

        if (!config.config_path.empty()) {
            load_yaml(config, config.config_path);
            app.parse(argc, argv);
        }
    } catch (const CLI::CallForHelp&) {
        config.show_help = true;
    } catch (const CLI::ParseError& e) {
        throw std::runtime_error(e.what());
    }

    return config;
}

void Config::print_usage(std::ostream& out) {
    Config   scratch;
    CLI::App app{"clawweb - single-host breadth-first web crawler"};
    define_options(app, scratch);
    out << app.help();
}

}  // namespace Core
}  // namespace Clawweb
