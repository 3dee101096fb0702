#include "assembler.hpp"
#include <algorithm>
#include <utility>

namespace Binder {
namespace Document {

using Core::ChapterResult;

namespace {

constexpr const char* STYLE =
    "body { font-family: sans-serif; line-height: 1.6; max-width: 800px; margin: 2rem auto; "
    "padding: 0 1rem; } h1, h2, h3 { line-height: 1.2; } hr { margin: 3rem 0; }";

std::string escape_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

}  // namespace

Assembler::Assembler(AssemblyOptions options) : options_(std::move(options)) {
}

void Assembler::sort_by_index(std::vector<ChapterResult>& chapters) {
    std::stable_sort(chapters.begin(), chapters.end(), [](const auto& a, const auto& b) {
        return a.index < b.index;
    });
}

std::string Assembler::join(std::vector<ChapterResult> chapters) const {
    sort_by_index(chapters);

    std::string body;
    for (size_t i = 0; i < chapters.size(); ++i) {
        if (i > 0)
            body += options_.separator;
        body += chapters[i].content;
    }
    return body;
}

std::string Assembler::wrap(const std::string& body) const {
    std::string html;
    html += "<!DOCTYPE html><html lang=\"en\"><head><meta charset=\"UTF-8\">";
    html += "<title>" + escape_text(options_.title) + "</title>\n";
    html += "<style>";
    html += STYLE;
    html += "</style>\n</head><body>";
    html += body;
    html += "</body></html>\n";
    return html;
}

std::string Assembler::assemble(std::vector<ChapterResult> chapters) const {
    return wrap(join(std::move(chapters)));
}

}  // namespace Document
}  // namespace Binder
