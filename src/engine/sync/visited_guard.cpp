#include "visited_guard.hpp"

namespace Binder {
namespace Engine {

bool VisitedGuard::claim(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.insert(identity).second;
}

std::size_t VisitedGuard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

}  // namespace Engine
}  // namespace Binder
