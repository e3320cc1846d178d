#pragma once

#include "value.hpp"

struct Config_;
class Reporter_;

/* A post is a map of field names to values.  Besides whatever the front matter supplies, a
   normalized post always has
        text    the body, converted to HTML if the source is Markdown
        path    destination-relative output path, extension ".html"
        url     base URL + '/' + path
   and has "date" whenever the front matter or the first ten characters of the path supply one.
*/

using Post_ = Map_;

namespace Post {
    extern const std::string TITLE;
    extern const std::string DATE;
    extern const std::string TAGS;
    extern const std::string LAYOUT;
    extern const std::string PATH;
    extern const std::string URL;
    extern const std::string TEXT;
    extern const std::string DEFAULT_LAYOUT;

    // source_path lies under <source>/posts
    Post_ Normalize(Map_ meta, const std::string& body, const std::string& source_path, const Config_& config);
    Post_ Read(const std::string& source_path, const Config_& config, const Reporter_& reporter);

    std::optional<std::string> Get(const Post_& post, const std::string& field); // string-valued fields only
    std::string Layout(const Post_& post);
    std::vector<std::string> Tags(const Post_& post); // in authored order, repeats kept
} // namespace Post
