#include "post.hpp"
#include "config.hpp"
#include "scratch.hpp"
#include <gtest/gtest.h>

namespace {
    Config_ SiteConfig(const std::string& source, const std::string& base_url) {
        Config_ retval;
        retval.sourceDir_ = source;
        retval.destDir_ = "build";
        retval.baseUrl_ = base_url;
        return retval;
    }

    std::string Field(const Post_& post, const std::string& name) { return Post::Get(post, name).value_or("<absent>"); }
} // namespace

TEST(PostTest, MarkdownBodyBecomesHtml) {
    const auto post = Post::Normalize(Map_(), "Hello *world*\n", "site/posts/hello.md", SiteConfig("site", ""));
    EXPECT_EQ(Field(post, Post::TEXT), "<p>Hello <em>world</em></p>\n");
}

TEST(PostTest, OtherBodiesPassThrough) {
    const auto post = Post::Normalize(Map_(), "<b>as is</b> *x*", "site/posts/raw.html", SiteConfig("site", ""));
    EXPECT_EQ(Field(post, Post::TEXT), "<b>as is</b> *x*");
    EXPECT_EQ(Field(post, Post::PATH), "raw.html");
}

TEST(PostTest, PathAndUrlAreRelativeToPosts) {
    const auto post = Post::Normalize(Map_(), "", "site/posts/notes/first.markdown", SiteConfig("site/", "https://example.org"));
    EXPECT_EQ(Field(post, Post::PATH), "notes/first.html");
    EXPECT_EQ(Field(post, Post::URL), "https://example.org/notes/first.html");
    EXPECT_EQ(post.count(Post::DATE), 0u);
}

TEST(PostTest, EmptyBaseUrlLeavesLeadingSlash) {
    const auto post = Post::Normalize(Map_(), "", "site/posts/a.md", SiteConfig("site", ""));
    EXPECT_EQ(Field(post, Post::URL), "/a.html");
}

TEST(PostTest, DateDerivedFromPathPrefix) {
    const auto post = Post::Normalize(Map_(), "", "site/posts/2024-06-01-summer.md", SiteConfig("site", ""));
    EXPECT_EQ(Field(post, Post::DATE), "2024-06-01T00:00:00+00:00");
}

TEST(PostTest, ExplicitDateWins) {
    Map_ meta;
    meta[Post::DATE] = Value_("2023-02-04T15:38:42Z");
    meta[Post::TITLE] = Value_("Kept");
    const auto post = Post::Normalize(meta, "", "site/posts/2024-06-01-summer.md", SiteConfig("site", ""));
    EXPECT_EQ(Field(post, Post::DATE), "2023-02-04T15:38:42Z");
    EXPECT_EQ(Field(post, Post::TITLE), "Kept");
}

TEST(PostTest, SourceOutsidePostsIsRejected) {
    EXPECT_THROW(Post::Normalize(Map_(), "", "elsewhere/posts/a.md", SiteConfig("site", "")), Error_);
    EXPECT_THROW(Post::Normalize(Map_(), "", "site/drafts/a.md", SiteConfig("site", "")), Error_);
}

TEST(PostTest, ReadsFromFile) {
    Scratch_ scratch("post");
    const std::string path = scratch.Write("posts/2024-01-01-new-year.md",
                                           "---\n"
                                           "title: New Year\n"
                                           "tags: [life, life, 7]\n"
                                           "layout: wide\n"
                                           "---\n"
                                           "# Hi\n");
    const auto post = Post::Read(path, SiteConfig(scratch.root_.string(), "http://x"), Reporter::Null());
    EXPECT_EQ(Field(post, Post::TITLE), "New Year");
    EXPECT_EQ(Field(post, Post::TEXT), "<h1>Hi</h1>\n");
    EXPECT_EQ(Field(post, Post::PATH), "2024-01-01-new-year.html");
    EXPECT_EQ(Field(post, Post::URL), "http://x/2024-01-01-new-year.html");
    EXPECT_EQ(Field(post, Post::DATE), "2024-01-01T00:00:00+00:00");
    EXPECT_EQ(Post::Tags(post), (std::vector<std::string>{"life", "life"}));
    EXPECT_EQ(Post::Layout(post), "wide");
}

TEST(PostTest, ReadMissingFileIsIoError) {
    Scratch_ scratch("post_missing");
    try {
        Post::Read(scratch.Path("posts/nothing.md"), SiteConfig(scratch.root_.string(), ""), Reporter::Null());
        FAIL() << "Expected an error";
    } catch (const Error_& e) {
        EXPECT_EQ(e.Kind(), Error_::Kind_::IO);
    }
}

TEST(PostTest, LayoutDefaults) {
    Post_ post;
    EXPECT_EQ(Post::Layout(post), Post::DEFAULT_LAYOUT);
    post[Post::LAYOUT] = Value_(3);
    EXPECT_EQ(Post::Layout(post), "default");
}

TEST(PostTest, TagsAcceptSingleString) {
    Post_ post;
    EXPECT_TRUE(Post::Tags(post).empty());
    post[Post::TAGS] = Value_("solo");
    EXPECT_EQ(Post::Tags(post), std::vector<std::string>{"solo"});
    post[Post::TAGS] = Value_(true);
    EXPECT_TRUE(Post::Tags(post).empty());
}
