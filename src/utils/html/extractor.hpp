#pragma once
#include <optional>
#include <string>
#include "selector.hpp"

namespace Binder {
namespace Utils {
namespace Html {

struct Extraction {
    bool                       found_content = false;
    std::string                content;    // inner HTML, verbatim from the source
    std::optional<std::string> next_href;  // raw href, not yet resolved
};

class Extractor {
public:
    Extractor(Selector content_selector, Selector next_selector);

    Extraction extract(const std::string& html) const;

private:
    Selector content_selector_;
    Selector next_selector_;
};

}  // namespace Html
}  // namespace Utils
}  // namespace Binder
