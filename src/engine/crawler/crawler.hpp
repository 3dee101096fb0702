#pragma once
#include <atomic>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/chapter.hpp"
#include "../../core/types/constants.hpp"
#include "../fetcher/page_fetcher.hpp"
#include "../sync/concurrency_limiter.hpp"
#include "../sync/result_collector.hpp"
#include "../sync/visited_guard.hpp"
#include "chapter_task.hpp"

namespace Binder {
namespace Engine {

using namespace Binder::Core;

struct CrawlerConfig {
    std::size_t max_concurrency     = Constants::DEFAULT_MAX_CONCURRENCY;
    int         threads             = Constants::DEFAULT_THREADS;
    std::size_t max_chapters        = Constants::DEFAULT_MAX_CHAPTERS;
    int         run_timeout_seconds = Constants::DEFAULT_RUN_TIMEOUT_SECONDS;
    bool        handle_signals      = true;

    std::string content_selector        = Constants::DEFAULT_CONTENT_SELECTOR;
    std::string next_selector           = Constants::DEFAULT_NEXT_SELECTOR;
    int         connect_timeout_ms      = Constants::CONNECT_TIMEOUT_MS;
    int         request_timeout_seconds = Constants::REQUEST_TIMEOUT_SECONDS;
    int         max_redirects           = Constants::DEFAULT_MAX_REDIRECTS;
    std::string user_agent              = Constants::USER_AGENT;
};

struct CrawlStats {
    std::size_t succeeded      = 0;
    std::size_t rejected       = 0;
    std::size_t failed         = 0;
    std::size_t cancelled      = 0;
    std::size_t spawned        = 0;
    std::size_t peak_in_flight = 0;
};

struct CrawlReport {
    std::vector<ChapterResult> chapters;  // arrival order; the assembler restores chain order
    std::vector<FetchFailure>  failures;
    CrawlStats                 stats;
    bool                       cancelled = false;
};

// One crawl run over a single chapter chain. Every discovered page becomes a
// coroutine (a driver invocation) on a shared io_context; the limiter, visited guard
// and collector are owned here and shared by reference with all of them.
// A ChainCrawler runs once.
class ChainCrawler {
public:
    explicit ChainCrawler(const CrawlerConfig& config, std::shared_ptr<PageFetcher> fetcher = nullptr);
    ~ChainCrawler();

    ChainCrawler(const ChainCrawler&)            = delete;
    ChainCrawler& operator=(const ChainCrawler&) = delete;

    // Blocks until the chain is exhausted or the run is cancelled. Throws
    // StartupError if start_url is not an absolute http(s) URL.
    CrawlReport run(const std::string& start_url);

    // Safe from any thread, including signal and timer handlers.
    void cancel(const std::string& reason);
    void shutdown();

    const ConcurrencyLimiter& limiter() const {
        return limiter_;
    }
    const VisitedGuard& visited() const {
        return visited_;
    }
    CrawlStats stats() const;

private:
    int                  num_threads_;
    std::size_t          max_chapters_;
    std::chrono::seconds run_timeout_;
    bool                 handle_signals_;

    std::shared_ptr<PageFetcher> fetcher_;
    ConcurrencyLimiter           limiter_;
    VisitedGuard                 visited_;
    ResultCollector              collector_;

    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> cancelled_tasks_{0};
    std::atomic<std::size_t> spawned_{0};

    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> is_shutdown_{false};

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                              work_guard_;
    boost::asio::signal_set   signals_{ioc_};
    boost::asio::steady_timer deadline_{ioc_};
    std::vector<std::thread>  io_threads_;

    static std::shared_ptr<PageFetcher> create_fetcher(const CrawlerConfig& config);

    void init_io_services();
    void init_signals();
    void init_deadline();

    void spawn(ChapterTask task, ResultCollector::Sender sender);
    void schedule_next(const ChapterTask&             task,
                       const std::string&             next_url,
                       const ResultCollector::Sender& sender);

    boost::asio::awaitable<void> drive(ChapterTask task, ResultCollector::Sender sender);
    boost::asio::awaitable<void> step(ChapterTask& task, const ResultCollector::Sender& sender);

    static void transition(ChapterTask& task, TaskState next);
    void        record(const ChapterTask& task);
};

}  // namespace Engine
}  // namespace Binder
