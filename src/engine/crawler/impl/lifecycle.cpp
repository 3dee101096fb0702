#include <csignal>
#include "../../../core/logger/logger.hpp"
#include "../../../core/types/errors.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Binder {
namespace Engine {

ChainCrawler::~ChainCrawler() {
    shutdown();
}

CrawlReport ChainCrawler::run(const std::string& start_url) {
    if (started_.exchange(true))
        throw std::logic_error("ChainCrawler::run called twice");

    auto start = Binder::Utils::Url::normalize(start_url);
    if (!start)
        throw StartupError("Malformed start URL: " + start_url);

    Logger::info("Crawler: Starting chain at " + *start);
    Logger::info("Crawler: Max concurrency " + std::to_string(limiter_.capacity()) + ", "
                 + std::to_string(num_threads_) + " IO threads");

    init_io_services();
    init_signals();
    init_deadline();

    spawn(ChapterTask(0, *start), collector_.make_sender());

    CrawlReport report;
    report.chapters  = collector_.collect();
    report.cancelled = cancelled_;

    shutdown();

    report.failures = collector_.failures();
    report.stats    = stats();
    Logger::debug("Crawler: " + std::to_string(visited_.size()) + " pages claimed, peak "
                  + std::to_string(report.stats.peak_in_flight) + " in flight");
    return report;
}

void ChainCrawler::init_io_services() {
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < num_threads_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
}

void ChainCrawler::init_signals() {
    if (!handle_signals_)
        return;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            cancel("signal " + std::to_string(signal_number) + " received");
        }
    });
}

void ChainCrawler::init_deadline() {
    if (run_timeout_.count() <= 0)
        return;

    deadline_.expires_after(run_timeout_);
    deadline_.async_wait([this](const boost::system::error_code& error) {
        if (!error) {
            cancel("run timeout of " + std::to_string(run_timeout_.count()) + "s reached");
        }
    });
}

void ChainCrawler::cancel(const std::string& reason) {
    if (cancelled_.exchange(true))
        return;

    Logger::warn("Cancelling crawl: " + reason);
    limiter_.cancel();
    collector_.cancel();
}

void ChainCrawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    // Nothing may be handed a slot once the io_context stops running handlers.
    limiter_.cancel();

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    boost::system::error_code ec;
    signals_.cancel(ec);
    deadline_.cancel();
}

}  // namespace Engine
}  // namespace Binder
