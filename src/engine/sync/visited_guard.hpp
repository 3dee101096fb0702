#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace Binder {
namespace Engine {

// Process-wide set of claimed page identities for one crawl run. The lock covers only
// the test-and-insert; callers must not hold anything from here across I/O.
class VisitedGuard {
public:
    // True for the first caller with a given identity, false for every later one.
    bool claim(const std::string& identity);

    std::size_t size() const;

private:
    std::unordered_set<std::string> claimed_;
    mutable std::mutex              mutex_;
};

}  // namespace Engine
}  // namespace Binder
