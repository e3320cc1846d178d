#include "frontmatter.hpp"
#include "parseutils.hpp"
#include <iterator>

using ParseUtils::StartsWith;

const std::string FrontMatter::DELIMITER("---");

std::string FrontMatter::ReadUntil(std::istream& src, const std::string& prefix, const std::string& source) {
    std::string retval, line;
    for (;;) {
        if (!std::getline(src, line))
            throw UnexpectedEof_(source);
        if (StartsWith(line, prefix))
            return retval;
        retval += line;
        retval.push_back('\n');
    }
}

FrontMatter::Parsed_ FrontMatter::Parse(std::istream& src, const std::string& source) {
    std::string first;
    // zero bytes means a truncated file, not a file without front matter
    if (!std::getline(src, first))
        throw UnexpectedEof_(source);
    REQUIRE(StartsWith(first, DELIMITER), "Missing front matter: " + source);

    const Value_ decoded = Value::ParseYaml(ReadUntil(src, DELIMITER, source));
    const Map_* meta = decoded.AsMap();
    REQUIRE(meta, "Front matter is not a mapping (found " + Value::Describe(decoded) + "): " + source);

    Parsed_ retval;
    retval.meta_ = *meta;
    retval.body_.assign(std::istreambuf_iterator<char>(src), std::istreambuf_iterator<char>());
    REQUIRE(!src.bad(), "Read failed: " + source);
    return retval;
}
