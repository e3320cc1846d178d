#ifndef FOLIO_PARSEUTILS__
#define FOLIO_PARSEUTILS__

#include <string>

namespace ParseUtils {
    bool IsWhite(char c);
    bool StartsWith(const std::string& line, const std::string& token);
    std::string AfterInitialWhitespace(const std::string& line);
    std::string TrimWhitespace(const std::string& src);
    std::string XmlSafe(const std::string& src); // makes embeddable within XML/HTML text and attributes
} // namespace ParseUtils

#endif
