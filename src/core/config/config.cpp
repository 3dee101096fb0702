#include "config.hpp"
#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>
#include "../../utils/html/selector.hpp"
#include "../../utils/url/url.hpp"
#include "../types/errors.hpp"

namespace Binder {
namespace Core {

int parse_log_level(const std::string& name) {
    if (name == "none")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn" || name == "quiet")
        return LOG_WARN | LOG_ERROR;
    if (name == "info")
        return LOG_DEFAULT;
    if (name == "debug" || name == "verbose")
        return LOG_ALL;
    throw StartupError("Unknown log level: " + name);
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["start_url"])
            config.start_url = yaml["start_url"].as<std::string>();
        if (yaml["url"])
            config.start_url = yaml["url"].as<std::string>();
        if (yaml["max_concurrency"])
            config.max_concurrency = yaml["max_concurrency"].as<int>();
        if (yaml["concurrency"])
            config.max_concurrency = yaml["concurrency"].as<int>();
        if (yaml["output"])
            config.output_path = yaml["output"].as<std::string>();
        if (yaml["output_path"])
            config.output_path = yaml["output_path"].as<std::string>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["content_selector"])
            config.content_selector = yaml["content_selector"].as<std::string>();
        if (yaml["next_selector"])
            config.next_selector = yaml["next_selector"].as<std::string>();
        if (yaml["title"])
            config.title = yaml["title"].as<std::string>();
        if (yaml["max_chapters"])
            config.max_chapters = yaml["max_chapters"].as<int>();
        if (yaml["request_timeout"])
            config.request_timeout = yaml["request_timeout"].as<int>();
        if (yaml["connect_timeout"])
            config.connect_timeout = yaml["connect_timeout"].as<int>();
        if (yaml["run_timeout"])
            config.run_timeout = yaml["run_timeout"].as<int>();
        if (yaml["max_redirects"])
            config.max_redirects = yaml["max_redirects"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = parse_log_level(yaml["log_level"].as<std::string>());
    } catch (const YAML::Exception& e) {
        throw StartupError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Binder - Fetches a chain of linked chapters and binds them into one document"};

    app.add_option("url", config.start_url, "Start URL of the chapter chain");
    app.add_option("-c,--concurrency", config.max_concurrency, "Maximum in-flight fetches");
    app.add_option("-o,--output", config.output_path, "Output HTML file");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("--content-selector", config.content_selector, "Selector of the chapter body");
    app.add_option("--next-selector", config.next_selector, "Selector of the next-chapter link");
    app.add_option("--title", config.title, "Title of the assembled document");
    app.add_option("--max-chapters", config.max_chapters, "Stop after this many chapters (0 = all)");
    app.add_option("--timeout", config.request_timeout, "Request timeout in seconds");
    app.add_option("--connect-timeout", config.connect_timeout, "Connect timeout in milliseconds");
    app.add_option("--run-timeout", config.run_timeout, "Abort the whole run after N seconds");
    app.add_option("--max-redirects", config.max_redirects, "Redirects followed per page");
    app.add_option("--user-agent", config.user_agent, "HTTP User-Agent");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag(
        "-q,--quiet",
        [&](size_t count) {
            if (count > 0)
                config.log_level = LOG_WARN | LOG_ERROR;
        },
        "Only print warnings and errors");
    app.add_flag(
        "-v,--verbose",
        [&](size_t count) {
            if (count > 0)
                config.log_level = LOG_ALL;
        },
        "Trace every chapter state transition");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

void Config::validate() const {
    if (!Binder::Utils::Url::normalize(start_url))
        throw StartupError("Malformed start URL: " + start_url);
    if (max_concurrency < 1)
        throw StartupError("max_concurrency must be positive, got " + std::to_string(max_concurrency));
    if (threads < 1)
        throw StartupError("threads must be at least 1, got " + std::to_string(threads));
    if (max_chapters < 0)
        throw StartupError("max_chapters cannot be negative");
    if (request_timeout < 1 || connect_timeout < 1)
        throw StartupError("timeouts must be positive");
    if (run_timeout < 0)
        throw StartupError("run_timeout cannot be negative");
    if (max_redirects < 0)
        throw StartupError("max_redirects cannot be negative");
    if (output_path.empty())
        throw StartupError("output path is empty");
    if (!Binder::Utils::Html::Selector::parse(content_selector))
        throw StartupError("Invalid content selector: '" + content_selector + "'");
    if (!Binder::Utils::Html::Selector::parse(next_selector))
        throw StartupError("Invalid next selector: '" + next_selector + "'");
}

}  // namespace Core
}  // namespace Binder
