#include "frontmatter.hpp"
#include "handle.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {
    FrontMatter::Parsed_ ParseText(const std::string& text) {
        std::istringstream src(text);
        return FrontMatter::Parse(src, "test.md");
    }
} // namespace

TEST(FrontMatterTest, SplitsMetadataFromBody) {
    const auto parsed = ParseText("---\n"
                                  "title: Hello\n"
                                  "tags: [a, b]\n"
                                  "---\n"
                                  "Body line one\n"
                                  "\n"
                                  "--- not a delimiter any more\n");
    ASSERT_EQ(parsed.meta_.size(), 2u);
    EXPECT_EQ(parsed.meta_.at("title"), Value_("Hello"));
    EXPECT_EQ(parsed.meta_.at("tags"), Value_(Array_{Value_("a"), Value_("b")}));
    EXPECT_EQ(parsed.body_, "Body line one\n\n--- not a delimiter any more\n");
}

TEST(FrontMatterTest, ClosingLineNeedOnlyStartWithDelimiter) {
    const auto parsed = ParseText("---\ntitle: x\n-----\nbody");
    EXPECT_EQ(parsed.meta_.at("title"), Value_("x"));
    EXPECT_EQ(parsed.body_, "body");
}

TEST(FrontMatterTest, EmptyBody) {
    const auto parsed = ParseText("---\ntitle: x\n---\n");
    EXPECT_TRUE(parsed.body_.empty());
}

TEST(FrontMatterTest, MissingOpeningDelimiter) {
    try {
        ParseText("title: Hello\n---\n");
        FAIL() << "Expected an error";
    } catch (const Error_& e) {
        EXPECT_EQ(e.Kind(), Error_::Kind_::OTHER);
        EXPECT_NE(std::string(e.what()).find("test.md"), std::string::npos);
    }
}

TEST(FrontMatterTest, EmptyInputIsUnexpectedEof) {
    try {
        ParseText("");
        FAIL() << "Expected an error";
    } catch (const UnexpectedEof_& e) {
        EXPECT_EQ(e.Kind(), Error_::Kind_::UNEXPECTED_EOF);
        EXPECT_EQ(e.source_, "test.md");
    }
}

TEST(FrontMatterTest, UnclosedBlockIsUnexpectedEof) {
    try {
        ParseText("---\ntitle: Hello\nno closing line\n");
        FAIL() << "Expected an error";
    } catch (const UnexpectedEof_& e) {
        EXPECT_EQ(e.source_, "test.md");
        EXPECT_EQ(std::string(e.what()), "Unexpected end of file: test.md");
    }
}

TEST(FrontMatterTest, BlockMustBeAMapping) {
    try {
        ParseText("---\n- a\n- b\n---\nbody\n");
        FAIL() << "Expected an error";
    } catch (const Error_& e) {
        EXPECT_EQ(e.Kind(), Error_::Kind_::OTHER);
        EXPECT_NE(std::string(e.what()).find("not a mapping"), std::string::npos);
    }
}

TEST(FrontMatterTest, EmptyBlockIsNotAMapping) {
    EXPECT_THROW(ParseText("---\n---\nbody\n"), Error_);
}

TEST(FrontMatterTest, MalformedYamlIsDecodeError) {
    try {
        ParseText("---\ntitle: [unclosed\n---\nbody\n");
        FAIL() << "Expected an error";
    } catch (const DecodeError_& e) {
        EXPECT_EQ(e.Kind(), Error_::Kind_::DECODE);
        EXPECT_FALSE(e.detail_.empty());
    }
}

TEST(FrontMatterTest, ReadUntilConsumesThePrefixLine) {
    std::istringstream src("one\ntwo\n===\nthree\n");
    EXPECT_EQ(FrontMatter::ReadUntil(src, "===", "s"), "one\ntwo\n");
    std::string rest;
    std::getline(src, rest);
    EXPECT_EQ(rest, "three");
}
