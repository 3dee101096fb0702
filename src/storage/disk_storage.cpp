#include "disk_storage.hpp"
#include <fstream>
#include "../core/logger/logger.hpp"
#include "../core/types/errors.hpp"

namespace Binder {
namespace Storage {

using Binder::Core::Logger;
using Binder::Core::PersistenceError;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
}

std::filesystem::path DiskStorage::path_for(const std::string& key) const {
    std::filesystem::path path(base_path_.empty() ? "." : base_path_);
    path /= key;
    return path;
}

void DiskStorage::save(const std::string& key, const std::string& content) {
    std::filesystem::path path = path_for(key);

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        throw PersistenceError("Cannot create directory for " + path.string() + ": "
                               + e.code().message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path.string());
        throw PersistenceError("Cannot open " + path.string() + " for writing");
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        Logger::error("Write Error: " + path.string());
        throw PersistenceError("Failed writing " + path.string());
    }

    Logger::success("Saved: " + path.string());
}

}  // namespace Storage
}  // namespace Binder
