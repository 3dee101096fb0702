#pragma once
#include <stdexcept>
#include <string>

namespace Binder {
namespace Core {

// Raised before any crawling starts: malformed start URL or unusable settings.
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& what) : std::runtime_error(what) {
    }
};

// Raised when the assembled document cannot be written.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Binder
