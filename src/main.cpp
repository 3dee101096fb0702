#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/errors.hpp"
#include "document/assembler.hpp"
#include "engine/crawler/crawler.hpp"
#include "storage/disk_storage.hpp"

namespace {

using namespace Binder;

Engine::CrawlerConfig to_crawler_config(const Core::Config& config) {
    Engine::CrawlerConfig crawler_config;
    crawler_config.max_concurrency         = static_cast<std::size_t>(config.max_concurrency);
    crawler_config.threads                 = config.threads;
    crawler_config.max_chapters            = static_cast<std::size_t>(config.max_chapters);
    crawler_config.run_timeout_seconds     = config.run_timeout;
    crawler_config.content_selector        = config.content_selector;
    crawler_config.next_selector           = config.next_selector;
    crawler_config.connect_timeout_ms      = config.connect_timeout;
    crawler_config.request_timeout_seconds = config.request_timeout;
    crawler_config.max_redirects           = config.max_redirects;
    crawler_config.user_agent              = config.user_agent;
    return crawler_config;
}

void save_document(const std::string& output_path, const std::string& html) {
    std::filesystem::path path(output_path);
    Storage::DiskStorage  storage(path.parent_path().string());
    storage.save(path.filename().string(), html);
}

int run(const Core::Config& config) {
    config.validate();

    Engine::CrawlReport report;
    {
        Engine::ChainCrawler crawler(to_crawler_config(config));
        report = crawler.run(config.start_url);
    }

    Core::Logger::info("Crawl complete. Scraped " + std::to_string(report.chapters.size())
                       + " chapters. Sorting and saving to " + config.output_path + "...");
    for (const auto& failure : report.failures) {
        Core::Logger::warn("Chain stopped at chapter " + std::to_string(failure.index) + " ("
                           + failure.url + "): " + Core::to_string(failure.error_type));
    }
    if (report.cancelled) {
        Core::Logger::warn("Run was cancelled; saving the chapters collected so far.");
    }

    Document::AssemblyOptions options;
    options.title = config.title;
    Document::Assembler assembler(options);

    save_document(config.output_path, assembler.assemble(std::move(report.chapters)));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Binder::Core::Config::parse(argc, argv);
        Binder::Core::Logger::set_level(config.log_level);
        return run(config);
    } catch (const Binder::Core::StartupError& e) {
        Binder::Core::Logger::error(e.what());
    } catch (const Binder::Core::PersistenceError& e) {
        Binder::Core::Logger::error("Could not save output: " + std::string(e.what()));
    } catch (const std::exception& e) {
        Binder::Core::Logger::error("Fatal: " + std::string(e.what()));
    }
    return 1;
}
