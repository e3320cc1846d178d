#pragma once

#include <cstdint>
#include <optional>
#include <string>

/* Dates travel through posts as ISO-8601 strings; they are only converted to
   seconds-since-epoch for ordering and for display formatting.
*/

namespace Date {
    // "YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)" or a bare "YYYY-MM-DD" (midnight UTC)
    std::optional<std::int64_t> Parse(const std::string& text);
    // a "YYYY-MM-DD" calendar date in the first ten characters of text
    std::optional<std::int64_t> FromPrefix(const std::string& text);

    std::string Iso8601(std::int64_t seconds); // always UTC, "+00:00" suffix
    std::string Format(const std::string& iso_text, const std::string& pattern); // strftime pattern, in the text's own offset
} // namespace Date
