#include "render.hpp"
#include "atom.hpp"
#include "config.hpp"
#include "file.hpp"
#include "reporter.hpp"
#include "template.hpp"
#include <nlohmann/json.hpp>

const std::string Render::INDEX_TEMPLATE("index");
const std::string Render::INDEX_FILE("index.html");
const std::string Render::FEED_FILE("atom.xml");

namespace {
    // a tag becomes a directory name
    void CheckTagName(const std::string& tag) {
        REQUIRE(!tag.empty() && tag != "." && tag != ".." && tag.find_first_of("/\\") == std::string::npos,
                "Tag '" + tag + "' cannot be used as a directory name");
    }

    void RenderTo(const std::string& filename,
                  const std::string& template_name,
                  const nlohmann::json& data,
                  const Template::Library_& templates,
                  const Reporter_& reporter) {
        reporter.Info("Rendering " + template_name + " to " + filename);
        std::ofstream dst;
        File::Create(filename, &dst);
        templates.Render(template_name, data, dst);
        dst.flush();
        if (!dst)
            throw IoError_("Can't write '" + filename + "'");
    }

    void WriteFeed(const Collection_& posts, const std::string& filename, const Reporter_& reporter) {
        reporter.Info("Writing feed " + filename);
        Atom::WriteFile(posts, filename);
    }
} // namespace

nlohmann::json Render::IndexView(const Collection_& posts,
                                 const std::vector<std::string>& tags,
                                 const std::optional<std::string>& tag) {
    auto retval = nlohmann::json::object();
    auto& all = retval["posts"] = nlohmann::json::array();
    for (const auto& post : posts)
        all.push_back(PostView(*post));
    retval["tags"] = tags;
    retval["tag"] = tag ? nlohmann::json(*tag) : nlohmann::json(nullptr);
    return retval;
}

nlohmann::json Render::PostView(const Post_& post) {
    static const std::vector<std::string> OPTIONAL_FIELDS = {Post::TITLE, Post::DATE, Post::TAGS, Post::LAYOUT};
    auto retval = Value::ToJson(Value_(post));
    for (const auto& field : OPTIONAL_FIELDS)
        if (!retval.contains(field))
            retval[field] = nullptr;
    return retval;
}

void Render::Index(const Collection_& posts,
                   const TagIndex_& index,
                   const Template::Library_& templates,
                   const Config_& config,
                   const Reporter_& reporter) {
    const auto view = IndexView(posts, Collection::TagNames(index), std::nullopt);
    RenderTo(File::Join(config.destDir_, INDEX_FILE), INDEX_TEMPLATE, view, templates, reporter);
    WriteFeed(posts, File::Join(config.destDir_, FEED_FILE), reporter);
}

void Render::Tags(const TagIndex_& index,
                  const Template::Library_& templates,
                  const Config_& config,
                  const Reporter_& reporter) {
    const auto names = Collection::TagNames(index);
    for (const auto& bucket : index) {
        CheckTagName(bucket.first);
        const std::string dir = File::Join(config.destDir_, bucket.first);
        const auto view = IndexView(bucket.second, names, bucket.first);
        RenderTo(File::Join(dir, INDEX_FILE), INDEX_TEMPLATE, view, templates, reporter);
        WriteFeed(bucket.second, File::Join(dir, FEED_FILE), reporter);
    }
}

void Render::Posts(const Collection_& posts,
                   const Template::Library_& templates,
                   const Config_& config,
                   const Reporter_& reporter) {
    for (const auto& post : posts) {
        auto path = Post::Get(*post, Post::PATH);
        REQUIRE(path, "Post has no destination path");
        const std::string filename = File::Join(config.destDir_, File::WithExtension(*path, ".html"));
        RenderTo(filename, Post::Layout(*post), PostView(*post), templates, reporter);
    }
}

void Render::All(const Collection_& posts,
                 const TagIndex_& index,
                 const Template::Library_& templates,
                 const Config_& config,
                 const Reporter_& reporter) {
    Posts(posts, templates, config, reporter);
    Index(posts, index, templates, config, reporter);
    Tags(index, templates, config, reporter);
}
