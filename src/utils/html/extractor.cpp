#include "extractor.hpp"
#include <gumbo.h>
#include <memory>
#include <utility>
#include "../text/string_utils.hpp"

namespace Binder {
namespace Utils {
namespace Html {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

bool is_element(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

std::string tag_name(const GumboElement& element) {
    if (element.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(element.tag);

    GumboStringPiece original = element.original_tag;
    gumbo_tag_from_original_text(&original);
    return Text::to_lower(std::string(original.data, original.length));
}

bool has_class(const GumboElement& element, const std::string& cls) {
    GumboAttribute* attr = gumbo_get_attribute(&element.attributes, "class");
    if (!attr)
        return false;
    for (const auto& token : Text::split_whitespace(attr->value)) {
        if (token == cls)
            return true;
    }
    return false;
}

bool matches(const GumboElement& element, const Selector& selector) {
    if (!selector.tag().empty() && tag_name(element) != selector.tag())
        return false;

    if (!selector.id().empty()) {
        GumboAttribute* id = gumbo_get_attribute(&element.attributes, "id");
        if (!id || selector.id() != id->value)
            return false;
    }

    for (const auto& cls : selector.classes()) {
        if (!has_class(element, cls))
            return false;
    }

    for (const auto& match : selector.attributes()) {
        GumboAttribute* attr = gumbo_get_attribute(&element.attributes, match.name.c_str());
        if (!attr)
            return false;
        if (match.value && *match.value != attr->value)
            return false;
    }
    return true;
}

const GumboNode* find_first(const GumboNode* node, const Selector& selector) {
    if (!is_element(node))
        return nullptr;
    if (matches(node->v.element, selector))
        return node;

    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        auto* found = find_first(static_cast<const GumboNode*>(children.data[i]), selector);
        if (found)
            return found;
    }
    return nullptr;
}

// End of the node's source text; null when the parser synthesized the whole node.
const char* source_end(const GumboNode* node) {
    if (!is_element(node)) {
        if (node->type == GUMBO_NODE_DOCUMENT)
            return nullptr;
        const GumboStringPiece& text = node->v.text.original_text;
        return text.data ? text.data + text.length : nullptr;
    }

    const GumboElement& element = node->v.element;
    if (element.original_end_tag.data)
        return element.original_end_tag.data + element.original_end_tag.length;

    const char* end = element.original_start_tag.data
                          ? element.original_start_tag.data + element.original_start_tag.length
                          : nullptr;
    for (unsigned int i = 0; i < element.children.length; ++i) {
        const char* child_end = source_end(static_cast<const GumboNode*>(element.children.data[i]));
        if (child_end && (!end || child_end > end))
            end = child_end;
    }
    return end;
}

std::string inner_html(const GumboNode* node) {
    const GumboElement& element = node->v.element;
    if (!element.original_start_tag.data)
        return "";

    const char* begin = element.original_start_tag.data + element.original_start_tag.length;
    const char* end   = nullptr;

    if (element.original_end_tag.data) {
        end = element.original_end_tag.data;
    }
    else {
        for (unsigned int i = 0; i < element.children.length; ++i) {
            const char* child_end =
                source_end(static_cast<const GumboNode*>(element.children.data[i]));
            if (child_end && (!end || child_end > end))
                end = child_end;
        }
    }

    if (!end || end < begin)
        return "";
    return std::string(begin, end);
}

}  // namespace

Extractor::Extractor(Selector content_selector, Selector next_selector)
    : content_selector_(std::move(content_selector)), next_selector_(std::move(next_selector)) {
}

Extraction Extractor::extract(const std::string& html) const {
    Extraction result;
    if (html.empty())
        return result;

    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output)
        return result;

    if (const GumboNode* content = find_first(output->root, content_selector_)) {
        result.found_content = true;
        result.content       = inner_html(content);
    }

    if (const GumboNode* link = find_first(output->root, next_selector_)) {
        GumboAttribute* href = gumbo_get_attribute(&link->v.element.attributes, "href");
        if (href) {
            result.next_href = std::string(href->value);
        }
    }

    return result;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Binder
