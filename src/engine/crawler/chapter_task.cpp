#include "chapter_task.hpp"
#include <stdexcept>
#include <utility>

namespace Binder {
namespace Engine {

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "Pending";
        case TaskState::TokenAcquired: return "TokenAcquired";
        case TaskState::Claimed: return "Claimed";
        case TaskState::Rejected: return "Rejected";
        case TaskState::Fetching: return "Fetching";
        case TaskState::Succeeded: return "Succeeded";
        case TaskState::Failed: return "Failed";
        case TaskState::Cancelled: return "Cancelled";
        case TaskState::Terminated: return "Terminated";
    }
    return "Unknown";
}

bool is_outcome(TaskState state) {
    return state == TaskState::Rejected || state == TaskState::Succeeded
           || state == TaskState::Failed || state == TaskState::Cancelled;
}

bool can_transition(TaskState from, TaskState to) {
    if (to == TaskState::Cancelled)
        return from == TaskState::Pending || from == TaskState::TokenAcquired
               || from == TaskState::Claimed || from == TaskState::Fetching;
    if (to == TaskState::Terminated)
        return is_outcome(from);

    switch (from) {
        case TaskState::Pending: return to == TaskState::TokenAcquired;
        case TaskState::TokenAcquired: return to == TaskState::Claimed || to == TaskState::Rejected;
        case TaskState::Claimed: return to == TaskState::Fetching;
        case TaskState::Fetching: return to == TaskState::Succeeded || to == TaskState::Failed;
        default: return false;
    }
}

ChapterTask::ChapterTask(Core::ChapterIndex index, std::string url)
    : index_(index), url_(std::move(url)) {
}

void ChapterTask::advance(TaskState next) {
    if (!can_transition(state_, next)) {
        throw std::logic_error(std::string("Invalid chapter task transition ") + to_string(state_)
                               + " -> " + to_string(next));
    }
    if (next == TaskState::Terminated)
        outcome_ = state_;
    state_ = next;
}

ChapterTask ChapterTask::next(std::string next_url) const {
    return ChapterTask(index_ + 1, std::move(next_url));
}

}  // namespace Engine
}  // namespace Binder
