#pragma once

#include "collection.hpp"
#include <ostream>

/* A deliberately minimal Atom document:  one <entry> per post holding <title>, <published> and
   <link href="..."/> when the post has title, date and url respectively.  The feed-level <id>,
   <title> and <updated> elements are not written, so the output is well-formed but not a
   conforming Atom feed.
*/

namespace Atom {
    void Write(const Collection_& posts, std::ostream& dst);
    void WriteFile(const Collection_& posts, const std::string& filename);
} // namespace Atom
