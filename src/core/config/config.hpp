#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Clawweb {
namespace Core {

struct Config {
    std::string              url;
    int                      depth      = Constants::DEFAULT_DEPTH;
    bool                     links_only = false;
    std::string              confine;
    std::vector<std::string> exclude;
    int                      threads    = Constants::DEFAULT_THREADS;
    long                     timeout    = Constants::REQUEST_TIMEOUT_SECONDS;
    std::string              user_agent = Constants::USER_AGENT;
    bool                     verbose    = false;
    std::string              config_path;
    bool                     show_help = false;

    // Command-line values win over values read from --config.
    static Config parse(int argc, char* argv[]);
    static void   print_usage(std::ostream& out);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Clawweb
