#include "result_collector.hpp"
#include <utility>

namespace Binder {
namespace Engine {

using Core::ChapterResult;
using Core::FetchFailure;

ResultCollector::Sender::Sender(const Sender& other) : owner_(other.owner_) {
    if (owner_)
        owner_->add_sender();
}

ResultCollector::Sender::Sender(Sender&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

ResultCollector::Sender& ResultCollector::Sender::operator=(const Sender& other) {
    if (this != &other) {
        if (other.owner_)
            other.owner_->add_sender();
        reset();
        owner_ = other.owner_;
    }
    return *this;
}

ResultCollector::Sender& ResultCollector::Sender::operator=(Sender&& other) noexcept {
    if (this != &other) {
        reset();
        owner_       = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

ResultCollector::Sender::~Sender() {
    reset();
}

void ResultCollector::Sender::send(ChapterResult result) const {
    if (owner_)
        owner_->push(std::move(result));
}

void ResultCollector::Sender::report_failure(FetchFailure failure) const {
    if (owner_)
        owner_->push_failure(std::move(failure));
}

void ResultCollector::Sender::reset() {
    if (owner_) {
        owner_->drop_sender();
        owner_ = nullptr;
    }
}

ResultCollector::Sender ResultCollector::make_sender() {
    add_sender();
    return Sender(this);
}

void ResultCollector::add_sender() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++senders_;
}

void ResultCollector::drop_sender() {
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (senders_ > 0)
            --senders_;
        last = senders_ == 0;
    }
    if (last)
        cv_.notify_all();
}

void ResultCollector::push(ChapterResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(result));
    }
    cv_.notify_all();
}

void ResultCollector::push_failure(FetchFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(std::move(failure));
}

std::vector<ChapterResult> ResultCollector::collect() {
    std::vector<ChapterResult>   results;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] { return !queue_.empty() || senders_ == 0 || cancelled_; });

        while (!queue_.empty()) {
            results.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }

        if (senders_ == 0 || cancelled_)
            return results;
    }
}

void ResultCollector::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool ResultCollector::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::size_t ResultCollector::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return senders_;
}

std::vector<FetchFailure> ResultCollector::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

}  // namespace Engine
}  // namespace Binder
