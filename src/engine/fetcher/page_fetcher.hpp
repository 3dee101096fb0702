#pragma once
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>
#include "../../core/types/chapter.hpp"

namespace Binder {
namespace Engine {

struct Page {
    std::string                url;
    std::string                content;
    std::optional<std::string> next_url;  // absolute and normalized
    bool                       success    = false;
    Core::FetchErrorType       error_type = Core::FetchErrorType::None;
    std::string                error;
};

// Fetches one page and extracts its chapter body and "next" link. Implementations
// report failures in the returned Page, must not retry and must not cache.
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    virtual boost::asio::awaitable<Page> fetch(const std::string& url) = 0;
};

}  // namespace Engine
}  // namespace Binder
