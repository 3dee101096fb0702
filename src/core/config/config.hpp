#pragma once
#include <string>

#include "../logger/logger.hpp"
#include "../types/constants.hpp"

namespace Binder {
namespace Core {

struct Config {
    std::string start_url       = Constants::DEFAULT_START_URL;
    int         max_concurrency = Constants::DEFAULT_MAX_CONCURRENCY;
    std::string output_path     = Constants::DEFAULT_OUTPUT_PATH;
    int         threads         = Constants::DEFAULT_THREADS;
    std::string config_path;

    std::string content_selector = Constants::DEFAULT_CONTENT_SELECTOR;
    std::string next_selector    = Constants::DEFAULT_NEXT_SELECTOR;
    std::string title            = Constants::DEFAULT_TITLE;

    int         max_chapters    = 0;                                   // 0 = Unlimited
    int         request_timeout = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    int         connect_timeout = Constants::CONNECT_TIMEOUT_MS;       // milliseconds
    int         run_timeout     = Constants::DEFAULT_RUN_TIMEOUT_SECONDS;  // 0 = None
    int         max_redirects   = Constants::DEFAULT_MAX_REDIRECTS;
    std::string user_agent      = Constants::USER_AGENT;
    int         log_level       = LOG_DEFAULT;

    static Config parse(int argc, char* argv[]);

    // Throws StartupError for settings a crawl cannot run with.
    void validate() const;
};

void load_yaml(Config& config, const std::string& path);
int  parse_log_level(const std::string& name);

}  // namespace Core
}  // namespace Binder
