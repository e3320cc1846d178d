#pragma once

#include "post.hpp"
#include <map>

/* The collection is every post of one build, newest first.  Posts are published as Handle_s once the
   collection is assembled; the tag index shares those handles rather than holding copies.
*/

using Collection_ = std::vector<Handle_<Post_>>;
using TagIndex_ = std::map<std::string, Collection_>; // tag name -> posts carrying it, in collection order

namespace Collection {
    // parses and normalizes every file under <source>/posts except hidden ones; the first failure aborts
    Collection_ Assemble(const Config_& config, const Reporter_& reporter);

    std::int64_t SortKey(const Post_& post); // seconds since epoch of "date"; the epoch when absent or unparseable
    void Sort(Collection_* posts); // newest first, stable
    TagIndex_ IndexTags(const Collection_& posts);
    std::vector<std::string> TagNames(const TagIndex_& index);
} // namespace Collection
