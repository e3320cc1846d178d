#pragma once

#include "value.hpp"
#include <istream>

/* A content document is a '---' line, a YAML mapping, another line beginning with '---',
   and then the body:

        ---
        title: Hello
        tags: [a, b]
        ---
        Body text...

   There is no front-matter-optional mode:  a document without the opening delimiter is rejected.
*/

namespace FrontMatter {
    extern const std::string DELIMITER;

    struct Parsed_ {
        Map_ meta_;
        std::string body_; // everything after the closing delimiter, untouched
    };

    // source names the stream in error messages
    Parsed_ Parse(std::istream& src, const std::string& source);

    // accumulates lines until one starts with prefix; the prefix line is consumed but not returned
    std::string ReadUntil(std::istream& src, const std::string& prefix, const std::string& source);
} // namespace FrontMatter
