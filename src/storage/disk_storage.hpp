#pragma once
#include <filesystem>
#include <string>
#include "storage.hpp"

namespace Binder {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    void save(const std::string& key, const std::string& content) override;

    std::filesystem::path path_for(const std::string& key) const;

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Binder
