#include "parseutils.hpp"

bool ParseUtils::IsWhite(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool ParseUtils::StartsWith(const std::string& line, const std::string& token) {
    return line.compare(0, token.size(), token) == 0;
}

std::string ParseUtils::AfterInitialWhitespace(const std::string& line) {
    if (line.empty())
        return std::string();
    auto offset = line.find_first_not_of(" \t\r\n");
    return offset == std::string::npos ? std::string() : line.substr(offset);
}

std::string ParseUtils::TrimWhitespace(const std::string& src) {
    std::string retval = AfterInitialWhitespace(src);
    while (!retval.empty() && IsWhite(retval.back()))
        retval.pop_back();
    return retval;
}

std::string ParseUtils::XmlSafe(const std::string& src) // hides &gt; &lt; &quot;
{
    std::string retval;
    retval.reserve(src.size());
    for (auto ps = src.begin(); ps != src.end(); ++ps) {
        if (*ps == '>')
            retval += "&gt;";
        else if (*ps == '<')
            retval += "&lt;";
        else if (*ps == '&')
            retval += "&amp;";
        else if (*ps == '"')
            retval += "&quot;";
        else
            retval.push_back(*ps);
    }
    return retval;
}
