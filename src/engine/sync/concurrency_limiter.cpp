#include "concurrency_limiter.hpp"
#include <algorithm>
#include <vector>

namespace Binder {
namespace Engine {

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t capacity) : capacity_(capacity) {
}

boost::asio::awaitable<ConcurrencyLimiter::Token> ConcurrencyLimiter::acquire() {
    co_await async_acquire(boost::asio::use_awaitable);
    co_return Token(this);
}

void ConcurrencyLimiter::enqueue(Waiter waiter) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
        lock.unlock();
        waiter(boost::asio::error::operation_aborted);
        return;
    }
    if (in_flight_ < capacity_) {
        ++in_flight_;
        peak_ = std::max(peak_, in_flight_);
        lock.unlock();
        waiter(boost::system::error_code{});
        return;
    }
    waiters_.push_back(std::move(waiter));
}

void ConcurrencyLimiter::release() {
    Waiter next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || waiters_.empty()) {
            if (in_flight_ > 0)
                --in_flight_;
            return;
        }
        // The slot passes straight to the next waiter.
        next = std::move(waiters_.front());
        waiters_.pop_front();
    }
    next(boost::system::error_code{});
}

void ConcurrencyLimiter::cancel() {
    std::vector<Waiter> aborted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        aborted.assign(std::make_move_iterator(waiters_.begin()),
                       std::make_move_iterator(waiters_.end()));
        waiters_.clear();
    }
    for (auto& waiter : aborted) {
        waiter(boost::asio::error::operation_aborted);
    }
}

std::size_t ConcurrencyLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ConcurrencyLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

std::size_t ConcurrencyLimiter::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

}  // namespace Engine
}  // namespace Binder
