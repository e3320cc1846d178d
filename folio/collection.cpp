#include "collection.hpp"
#include "config.hpp"
#include "date.hpp"
#include "file.hpp"
#include "reporter.hpp"
#include <algorithm>
#include <filesystem>

namespace {
    const std::string ANY_FILE(".*");

    // dot-files anywhere below the root are editor and system clutter, as with assets
    bool IsHiddenBelow(const std::string& path, const std::string& root) {
        const std::filesystem::path relative(File::RelativeTo(path, root));
        for (const auto& part : relative)
            if (File::IsHidden(part.string()))
                return true;
        return false;
    }
} // namespace

Collection_ Collection::Assemble(const Config_& config, const Reporter_& reporter) {
    const std::string postsDir = Config::PostsDir(config);
    reporter.Info("Reading posts from " + postsDir);
    Collection_ retval;
    // File::List sorts by path, so equal dates keep path order
    for (const auto& source : File::List(postsDir, ANY_FILE)) {
        if (IsHiddenBelow(source, postsDir)) {
            reporter.Debug("Skipping hidden " + source);
            continue;
        }
        retval.push_back(std::make_shared<const Post_>(Post::Read(source, config, reporter)));
    }
    Sort(&retval);
    reporter.Info("Read " + std::to_string(retval.size()) + " posts");
    return retval;
}

std::int64_t Collection::SortKey(const Post_& post) {
    if (auto text = Post::Get(post, Post::DATE)) {
        if (auto seconds = Date::Parse(*text))
            return *seconds;
    }
    return 0;
}

void Collection::Sort(Collection_* posts) {
    std::vector<std::pair<std::int64_t, Handle_<Post_>>> keyed;
    keyed.reserve(posts->size());
    for (const auto& post : *posts)
        keyed.emplace_back(SortKey(*post), post);
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });
    posts->clear();
    for (auto& k : keyed)
        posts->push_back(std::move(k.second));
}

TagIndex_ Collection::IndexTags(const Collection_& posts) {
    TagIndex_ retval;
    for (const auto& post : posts)
        for (const auto& tag : Post::Tags(*post))
            retval[tag].push_back(post);
    return retval;
}

std::vector<std::string> Collection::TagNames(const TagIndex_& index) {
    std::vector<std::string> retval;
    retval.reserve(index.size());
    for (const auto& bucket : index)
        retval.push_back(bucket.first);
    return retval;
}
