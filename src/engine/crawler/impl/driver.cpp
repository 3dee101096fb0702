#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Binder {
namespace Engine {

namespace {

std::string describe(const ChapterTask& task) {
    return "chapter " + std::to_string(task.index()) + " (" + task.url() + ")";
}

}  // namespace

void ChainCrawler::spawn(ChapterTask task, ResultCollector::Sender sender) {
    boost::asio::co_spawn(ioc_, drive(std::move(task), std::move(sender)), boost::asio::detached);
}

void ChainCrawler::schedule_next(const ChapterTask&             task,
                                 const std::string&             next_url,
                                 const ResultCollector::Sender& sender) {
    if (cancelled_)
        return;

    ChapterTask next = task.next(next_url);
    if (max_chapters_ > 0 && next.index() >= max_chapters_) {
        Logger::warn("Chapter limit (" + std::to_string(max_chapters_) + ") reached, not following "
                     + next_url);
        return;
    }

    spawned_++;
    spawn(std::move(next), sender);
}

void ChainCrawler::transition(ChapterTask& task, TaskState next) {
    TaskState from = task.state();
    task.advance(next);
    Logger::debug(describe(task) + ": " + to_string(from) + " -> " + to_string(next));
}

void ChainCrawler::record(const ChapterTask& task) {
    switch (task.outcome()) {
        case TaskState::Succeeded: succeeded_++; break;
        case TaskState::Rejected: rejected_++; break;
        case TaskState::Failed: failed_++; break;
        case TaskState::Cancelled: cancelled_tasks_++; break;
        default: break;
    }
}

boost::asio::awaitable<void> ChainCrawler::drive(ChapterTask task, ResultCollector::Sender sender) {
    try {
        co_await step(task, sender);
    } catch (const boost::system::system_error& e) {
        if (e.code() != boost::asio::error::operation_aborted)
            Logger::error("Driver error on " + describe(task) + ": " + e.what());
        if (can_transition(task.state(), TaskState::Cancelled))
            transition(task, TaskState::Cancelled);
    } catch (const std::exception& e) {
        Logger::error("Driver error on " + describe(task) + ": " + e.what());
        if (task.state() == TaskState::Fetching) {
            transition(task, TaskState::Failed);
            sender.report_failure({task.index(), task.url(), FetchErrorType::Network, e.what()});
        }
        else if (can_transition(task.state(), TaskState::Cancelled)) {
            transition(task, TaskState::Cancelled);
        }
    }

    if (is_outcome(task.state())) {
        transition(task, TaskState::Terminated);
        record(task);
    }
    // Dropping the sender here retires this producer.
}

boost::asio::awaitable<void> ChainCrawler::step(ChapterTask&                   task,
                                                const ResultCollector::Sender& sender) {
    auto token = co_await limiter_.acquire();
    transition(task, TaskState::TokenAcquired);

    if (cancelled_) {
        transition(task, TaskState::Cancelled);
        co_return;
    }

    if (!visited_.claim(task.url())) {
        transition(task, TaskState::Rejected);
        Logger::info("Skipping " + describe(task) + ": already visited");
        co_return;
    }
    transition(task, TaskState::Claimed);

    Logger::info("Scraping chapter " + std::to_string(task.index()) + ": " + task.url());
    transition(task, TaskState::Fetching);
    Page page = co_await fetcher_->fetch(task.url());

    if (!page.success) {
        transition(task, TaskState::Failed);
        Logger::error("Error scraping " + task.url() + " [" + to_string(page.error_type)
                      + "]: " + page.error);
        sender.report_failure({task.index(), task.url(), page.error_type, page.error});
        co_return;
    }

    transition(task, TaskState::Succeeded);
    sender.send({task.index(), task.url(), std::move(page.content)});

    if (page.next_url) {
        schedule_next(task, *page.next_url, sender);
    }
}

}  // namespace Engine
}  // namespace Binder
