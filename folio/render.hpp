#pragma once

#include "collection.hpp"
#include <nlohmann/json_fwd.hpp>

namespace Template {
    class Library_;
}

/* Output layout under the destination directory:
        index.html          "index" template over every post
        atom.xml            feed over every post
        <tag>/index.html    "index" template over the posts carrying <tag>
        <tag>/atom.xml      feed over the same posts
        <path>              each post through its "layout" template (default "default")

   Rendering starts only after the collection and tag index are complete, and stops at the first
   failure; files already written stay where they are.
*/

namespace Render {
    extern const std::string INDEX_TEMPLATE;
    extern const std::string INDEX_FILE;
    extern const std::string FEED_FILE;

    // {"posts": [...], "tags": [...], "tag": name or null}
    nlohmann::json IndexView(const Collection_& posts, const std::vector<std::string>& tags, const std::optional<std::string>& tag);
    // the post itself, with absent conventional fields present as null
    nlohmann::json PostView(const Post_& post);

    void Index(const Collection_& posts, const TagIndex_& index, const Template::Library_& templates, const Config_& config, const Reporter_& reporter);
    void Tags(const TagIndex_& index, const Template::Library_& templates, const Config_& config, const Reporter_& reporter);
    void Posts(const Collection_& posts, const Template::Library_& templates, const Config_& config, const Reporter_& reporter);

    void All(const Collection_& posts, const TagIndex_& index, const Template::Library_& templates, const Config_& config, const Reporter_& reporter);
} // namespace Render
