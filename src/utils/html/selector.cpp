#include "selector.hpp"
#include <cctype>
#include "../text/string_utils.hpp"

namespace Binder {
namespace Utils {
namespace Html {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'
           || static_cast<unsigned char>(c) >= 0x80;
}

std::string read_ident(const std::string& s, size_t& pos) {
    size_t start = pos;
    while (pos < s.size() && is_ident_char(s[pos]))
        ++pos;
    return s.substr(start, pos - start);
}

bool read_attribute(const std::string& s, size_t& pos, AttributeMatch& out) {
    ++pos;  // '['
    while (pos < s.size() && s[pos] == ' ')
        ++pos;

    out.name = Text::to_lower(read_ident(s, pos));
    if (out.name.empty())
        return false;

    while (pos < s.size() && s[pos] == ' ')
        ++pos;
    if (pos >= s.size())
        return false;

    if (s[pos] == ']') {
        ++pos;
        return true;
    }
    if (s[pos] != '=')
        return false;
    ++pos;

    while (pos < s.size() && s[pos] == ' ')
        ++pos;
    if (pos >= s.size())
        return false;

    if (s[pos] == '\'' || s[pos] == '"') {
        char   quote = s[pos];
        size_t close = s.find(quote, pos + 1);
        if (close == std::string::npos)
            return false;
        out.value = s.substr(pos + 1, close - pos - 1);
        pos       = close + 1;
    }
    else {
        std::string value = read_ident(s, pos);
        if (value.empty())
            return false;
        out.value = value;
    }

    while (pos < s.size() && s[pos] == ' ')
        ++pos;
    if (pos >= s.size() || s[pos] != ']')
        return false;
    ++pos;
    return true;
}

}  // namespace

std::optional<Selector> Selector::parse(const std::string& text) {
    Selector    selector;
    std::string s = Text::trim(text);
    if (s.empty())
        return std::nullopt;

    selector.text_ = s;
    size_t pos     = 0;

    if (s[0] == '*') {
        ++pos;
    }
    else {
        selector.tag_ = Text::to_lower(read_ident(s, pos));
    }

    while (pos < s.size()) {
        char c = s[pos];
        if (c == '#' || c == '.') {
            ++pos;
            std::string ident = read_ident(s, pos);
            if (ident.empty())
                return std::nullopt;
            if (c == '#') {
                if (!selector.id_.empty())
                    return std::nullopt;
                selector.id_ = ident;
            }
            else {
                selector.classes_.push_back(ident);
            }
        }
        else if (c == '[') {
            AttributeMatch match;
            if (!read_attribute(s, pos, match))
                return std::nullopt;
            selector.attributes_.push_back(std::move(match));
        }
        else {
            return std::nullopt;
        }
    }

    return selector;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Binder
