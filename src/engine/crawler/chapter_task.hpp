#pragma once
#include <string>
#include "../../core/types/chapter.hpp"

namespace Binder {
namespace Engine {

enum class TaskState {
    Pending,
    TokenAcquired,
    Claimed,
    Rejected,
    Fetching,
    Succeeded,
    Failed,
    Cancelled,
    Terminated
};

const char* to_string(TaskState state);
bool        can_transition(TaskState from, TaskState to);
bool        is_outcome(TaskState state);

// One driver invocation: a chapter position and the page identity to fetch for it.
class ChapterTask {
public:
    ChapterTask(Core::ChapterIndex index, std::string url);

    // Throws std::logic_error on a transition the driver must never make.
    void advance(TaskState next);

    Core::ChapterIndex index() const {
        return index_;
    }
    const std::string& url() const {
        return url_;
    }
    TaskState state() const {
        return state_;
    }
    // Last state before Terminated.
    TaskState outcome() const {
        return outcome_;
    }

    ChapterTask next(std::string next_url) const;

private:
    Core::ChapterIndex index_;
    std::string        url_;
    TaskState          state_   = TaskState::Pending;
    TaskState          outcome_ = TaskState::Pending;
};

}  // namespace Engine
}  // namespace Binder
