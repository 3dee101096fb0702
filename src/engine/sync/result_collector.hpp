#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "../../core/types/chapter.hpp"

namespace Binder {
namespace Engine {

// Many-producer, single-consumer channel of chapter results with explicit quiescence
// tracking. Every live producer holds a Sender; copying a Sender registers one more
// producer and destroying it retires one. collect() returns once the last Sender is
// gone and the queue is drained, or as soon as cancel() is called.
class ResultCollector {
public:
    class Sender {
    public:
        Sender() = default;
        Sender(const Sender& other);
        Sender(Sender&& other) noexcept;
        Sender& operator=(const Sender& other);
        Sender& operator=(Sender&& other) noexcept;
        ~Sender();

        void send(Core::ChapterResult result) const;
        void report_failure(Core::FetchFailure failure) const;
        void reset();

        bool valid() const {
            return owner_ != nullptr;
        }

    private:
        friend class ResultCollector;
        explicit Sender(ResultCollector* owner) : owner_(owner) {
        }

        ResultCollector* owner_ = nullptr;
    };

    ResultCollector() = default;

    ResultCollector(const ResultCollector&)            = delete;
    ResultCollector& operator=(const ResultCollector&) = delete;

    Sender make_sender();

    // Consumer side. Blocks the calling thread; results come back in arrival order.
    std::vector<Core::ChapterResult> collect();

    void cancel();

    bool                            cancelled() const;
    std::size_t                     outstanding() const;
    std::vector<Core::FetchFailure> failures() const;

private:
    std::deque<Core::ChapterResult> queue_;
    std::vector<Core::FetchFailure> failures_;
    std::size_t                     senders_   = 0;
    bool                            cancelled_ = false;
    mutable std::mutex              mutex_;
    std::condition_variable         cv_;

    void add_sender();
    void drop_sender();
    void push(Core::ChapterResult result);
    void push_failure(Core::FetchFailure failure);
};

}  // namespace Engine
}  // namespace Binder
