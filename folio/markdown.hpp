#pragma once

#include <string>

namespace Markdown {
    bool IsMarkdown(const std::string& extension); // ".md", ".markdown"
    std::string ToHtml(const std::string& markdown); // CommonMark
} // namespace Markdown
