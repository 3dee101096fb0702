#pragma once
#include <cstddef>
#include <string>

namespace Binder {
namespace Core {

using ChapterIndex = std::size_t;

struct ChapterResult {
    ChapterIndex index = 0;
    std::string  url;
    std::string  content;
};

enum class FetchErrorType { None, Network, Decode, ContentNotFound, LinkResolution };

struct FetchFailure {
    ChapterIndex   index = 0;
    std::string    url;
    FetchErrorType error_type = FetchErrorType::None;
    std::string    error;
};

inline const char* to_string(FetchErrorType type) {
    switch (type) {
        case FetchErrorType::None: return "none";
        case FetchErrorType::Network: return "network";
        case FetchErrorType::Decode: return "decode";
        case FetchErrorType::ContentNotFound: return "content not found";
        case FetchErrorType::LinkResolution: return "link resolution";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Binder
