#pragma once
#include <string>

namespace Binder {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Throws Core::PersistenceError when the content cannot be written.
    virtual void save(const std::string& key, const std::string& content) = 0;
};

}  // namespace Storage
}  // namespace Binder
