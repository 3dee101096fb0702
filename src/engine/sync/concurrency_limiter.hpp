#pragma once
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace Binder {
namespace Engine {

// Asynchronous counting semaphore for coroutines running on a multi-threaded
// io_context. A waiter is resumed on its own associated executor; slots freed while
// waiters exist are handed over directly, so in_flight() never exceeds capacity().
class ConcurrencyLimiter {
public:
    // Returns its slot on destruction.
    class Token {
    public:
        Token() = default;
        explicit Token(ConcurrencyLimiter* owner) : owner_(owner) {
        }
        Token(Token&& other) noexcept : owner_(other.owner_) {
            other.owner_ = nullptr;
        }
        Token& operator=(Token&& other) noexcept {
            if (this != &other) {
                release();
                owner_       = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Token(const Token&)            = delete;
        Token& operator=(const Token&) = delete;
        ~Token() {
            release();
        }

        bool valid() const {
            return owner_ != nullptr;
        }
        void release() {
            if (owner_) {
                owner_->release();
                owner_ = nullptr;
            }
        }

    private:
        ConcurrencyLimiter* owner_ = nullptr;
    };

    explicit ConcurrencyLimiter(std::size_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&)            = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    // Suspends until a slot is free. Throws boost::system::system_error
    // (operation_aborted) once the limiter has been cancelled.
    boost::asio::awaitable<Token> acquire();

    template <typename CompletionToken>
    auto async_acquire(CompletionToken&& token) {
        return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code)>(
            [this](auto handler) {
                using Handler = std::decay_t<decltype(handler)>;
                auto shared   = std::make_shared<Handler>(std::move(handler));
                enqueue([shared](boost::system::error_code ec) {
                    auto ex = boost::asio::get_associated_executor(*shared);
                    boost::asio::post(ex, [shared, ec]() { (*shared)(ec); });
                });
            },
            token);
    }

    // Fails every pending and future acquisition with operation_aborted.
    void cancel();

    std::size_t capacity() const {
        return capacity_;
    }
    std::size_t in_flight() const;
    std::size_t peak() const;
    std::size_t waiting() const;

private:
    using Waiter = std::function<void(boost::system::error_code)>;

    const std::size_t  capacity_;
    std::size_t        in_flight_ = 0;
    std::size_t        peak_      = 0;
    bool               cancelled_ = false;
    std::deque<Waiter> waiters_;
    mutable std::mutex mutex_;

    void enqueue(Waiter waiter);
    void release();
};

}  // namespace Engine
}  // namespace Binder
