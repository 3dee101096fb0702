#include "crawler.hpp"
#include "../../core/types/errors.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../utils/html/extractor.hpp"
#include "../../utils/html/selector.hpp"
#include "../fetcher/http_page_fetcher.hpp"

namespace Binder {
namespace Engine {

using namespace Binder::Network::Http;
using namespace Binder::Utils::Html;

namespace {

Selector parse_selector(const std::string& text, const char* what) {
    auto selector = Selector::parse(text);
    if (!selector)
        throw StartupError(std::string("Invalid ") + what + " selector: '" + text + "'");
    return *selector;
}

}  // namespace

ChainCrawler::ChainCrawler(const CrawlerConfig& config, std::shared_ptr<PageFetcher> fetcher)
    : num_threads_(config.threads),
      max_chapters_(config.max_chapters),
      run_timeout_(config.run_timeout_seconds),
      handle_signals_(config.handle_signals),
      fetcher_(fetcher ? std::move(fetcher) : create_fetcher(config)),
      limiter_(config.max_concurrency) {
    if (config.max_concurrency == 0)
        throw StartupError("max_concurrency must be positive");
    if (config.threads < 1)
        throw StartupError("threads must be at least 1");
}

std::shared_ptr<PageFetcher> ChainCrawler::create_fetcher(const CrawlerConfig& config) {
    Extractor extractor(parse_selector(config.content_selector, "content"),
                        parse_selector(config.next_selector, "next"));

    auto client = std::make_unique<BeastClient>();
    client->set_connect_timeout(std::chrono::milliseconds(config.connect_timeout_ms));
    client->set_request_timeout(std::chrono::seconds(config.request_timeout_seconds));
    client->set_user_agent(config.user_agent);

    return std::make_shared<HttpPageFetcher>(
        std::move(client), std::move(extractor), config.max_redirects);
}

CrawlStats ChainCrawler::stats() const {
    CrawlStats s;
    s.succeeded      = succeeded_;
    s.rejected       = rejected_;
    s.failed         = failed_;
    s.cancelled      = cancelled_tasks_;
    s.spawned        = spawned_;
    s.peak_in_flight = limiter_.peak();
    return s;
}

}  // namespace Engine
}  // namespace Binder
