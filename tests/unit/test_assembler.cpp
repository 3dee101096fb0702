#include <gtest/gtest.h>
#include "../../src/document/assembler.hpp"

using namespace Binder::Document;
using Binder::Core::ChapterResult;

TEST(AssemblerTest, JoinsInChainOrder) {
    std::vector<ChapterResult> chapters = {
        {2, "https://b.test/c", "<p>C</p>"},
        {0, "https://b.test/a", "<p>A</p>"},
        {1, "https://b.test/b", "<p>B</p>"},
    };

    Assembler assembler;
    EXPECT_EQ(assembler.join(chapters), "<p>A</p><hr />\n<p>B</p><hr />\n<p>C</p>");
}

TEST(AssemblerTest, SingleAndEmpty) {
    Assembler assembler;
    EXPECT_EQ(assembler.join({{0, "https://b.test/a", "only"}}), "only");
    EXPECT_EQ(assembler.join({}), "");
}

TEST(AssemblerTest, SortIsStable) {
    std::vector<ChapterResult> chapters = {
        {1, "u1", "first one"},
        {0, "u0", "zero"},
        {1, "u1b", "second one"},
    };
    Assembler::sort_by_index(chapters);
    EXPECT_EQ(chapters[0].content, "zero");
    EXPECT_EQ(chapters[1].content, "first one");
    EXPECT_EQ(chapters[2].content, "second one");
}

TEST(AssemblerTest, WrapProducesDocumentShell) {
    AssemblyOptions options;
    options.title = "Tips & <Tricks>";
    Assembler assembler(options);

    std::string html = assembler.assemble({{0, "u", "<h1>Intro</h1>"}});
    EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
    EXPECT_NE(html.find("<meta charset=\"UTF-8\">"), std::string::npos);
    EXPECT_NE(html.find("<title>Tips &amp; &lt;Tricks&gt;</title>"), std::string::npos);
    EXPECT_NE(html.find("<body><h1>Intro</h1></body>"), std::string::npos);
}

TEST(AssemblerTest, CustomSeparator) {
    AssemblyOptions options;
    options.separator = "\n";
    Assembler assembler(options);
    EXPECT_EQ(assembler.join({{1, "b", "B"}, {0, "a", "A"}}), "A\nB");
}
