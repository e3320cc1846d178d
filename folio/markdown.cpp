#include "markdown.hpp"
#include "handle.hpp"
#include <md4c-html.h>

namespace {
    void Append(const MD_CHAR* text, MD_SIZE size, void* dst) { static_cast<std::string*>(dst)->append(text, size); }
} // namespace

bool Markdown::IsMarkdown(const std::string& extension) { return extension == ".md" || extension == ".markdown"; }

std::string Markdown::ToHtml(const std::string& markdown) {
    std::string retval;
    retval.reserve(markdown.size() + markdown.size() / 4);
    const int rc = md_html(markdown.data(), static_cast<MD_SIZE>(markdown.size()), Append, &retval, 0, 0);
    REQUIRE(rc == 0, "Markdown conversion failed");
    return retval;
}
