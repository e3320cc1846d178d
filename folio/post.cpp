#include "post.hpp"
#include "config.hpp"
#include "date.hpp"
#include "file.hpp"
#include "frontmatter.hpp"
#include "markdown.hpp"

const std::string Post::TITLE("title");
const std::string Post::DATE("date");
const std::string Post::TAGS("tags");
const std::string Post::LAYOUT("layout");
const std::string Post::PATH("path");
const std::string Post::URL("url");
const std::string Post::TEXT("text");
const std::string Post::DEFAULT_LAYOUT("default");

Post_ Post::Normalize(Map_ meta, const std::string& body, const std::string& source_path, const Config_& config) {
    Post_ retval(std::move(meta));
    retval[TEXT] = Markdown::IsMarkdown(File::Extension(source_path)) ? Markdown::ToHtml(body) : body;

    const std::string relative = File::RelativeTo(File::RelativeTo(source_path, config.sourceDir_), "posts");
    const std::string path = File::WithExtension(relative, ".html");
    retval[PATH] = path;
    retval[URL] = config.baseUrl_ + "/" + path;

    if (!retval.count(DATE)) {
        if (auto date = Date::FromPrefix(path))
            retval[DATE] = Date::Iso8601(*date);
    }
    return retval;
}

Post_ Post::Read(const std::string& source_path, const Config_& config, const Reporter_& reporter) {
    reporter.Debug("Parsing " + source_path);
    std::ifstream src;
    File::Open(source_path, &src);
    auto parsed = FrontMatter::Parse(src, source_path);
    return Normalize(std::move(parsed.meta_), parsed.body_, source_path, config);
}

std::optional<std::string> Post::Get(const Post_& post, const std::string& field) {
    auto pf = post.find(field);
    return pf == post.end() ? std::nullopt : pf->second.AsString();
}

std::string Post::Layout(const Post_& post) { return Get(post, LAYOUT).value_or(DEFAULT_LAYOUT); }

std::vector<std::string> Post::Tags(const Post_& post) {
    std::vector<std::string> retval;
    auto pt = post.find(TAGS);
    if (pt == post.end())
        return retval;
    if (auto single = pt->second.AsString())
        retval.push_back(*single);
    else if (auto many = pt->second.AsArray()) {
        for (const auto& tag : *many)
            if (auto name = tag.AsString())
                retval.push_back(*name);
    }
    return retval;
}
