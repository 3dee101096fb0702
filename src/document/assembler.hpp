#pragma once
#include <string>
#include <vector>
#include "../core/types/chapter.hpp"
#include "../core/types/constants.hpp"

namespace Binder {
namespace Document {

struct AssemblyOptions {
    std::string title     = Core::Constants::DEFAULT_TITLE;
    std::string separator = Core::Constants::CHAPTER_SEPARATOR;
};

class Assembler {
public:
    explicit Assembler(AssemblyOptions options = {});

    // Chapters may arrive in any order; output follows ascending index.
    std::string assemble(std::vector<Core::ChapterResult> chapters) const;

    std::string join(std::vector<Core::ChapterResult> chapters) const;
    std::string wrap(const std::string& body) const;

    static void sort_by_index(std::vector<Core::ChapterResult>& chapters);

private:
    AssemblyOptions options_;
};

}  // namespace Document
}  // namespace Binder
