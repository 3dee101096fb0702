#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Binder {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
std::vector<std::string> split_whitespace(const std::string& str);

// Strict check: rejects overlong forms, surrogates and code points past U+10FFFF.
bool is_valid_utf8(std::string_view text);

}  // namespace Text
}  // namespace Utils
}  // namespace Binder
