#pragma once
#include <optional>
#include <string>
#include <vector>

namespace Binder {
namespace Utils {
namespace Html {

struct AttributeMatch {
    std::string                name;
    std::optional<std::string> value;
};

// A single compound selector: tag name followed by #id, .class and [attr=value]
// qualifiers, e.g. "main", "div#content.chapter" or "a[title='Next chapter']".
// Combinators (descendant, child, grouping) are not supported.
class Selector {
public:
    static std::optional<Selector> parse(const std::string& text);

    const std::string&                 text() const { return text_; }
    const std::string&                 tag() const { return tag_; }
    const std::string&                 id() const { return id_; }
    const std::vector<std::string>&    classes() const { return classes_; }
    const std::vector<AttributeMatch>& attributes() const { return attributes_; }

private:
    std::string                 text_;
    std::string                 tag_;  // lower-case, empty matches any element
    std::string                 id_;
    std::vector<std::string>    classes_;
    std::vector<AttributeMatch> attributes_;
};

}  // namespace Html
}  // namespace Utils
}  // namespace Binder
