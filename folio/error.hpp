#pragma once

#include <stdexcept>
#include <string>

// Error_ is the only exception type thrown by folio; what() is the display text
class Error_ : public std::runtime_error {
public:
    enum class Kind_ { IO, TEMPLATE, UNEXPECTED_EOF, DECODE, OTHER };

    Error_(Kind_ kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    Kind_ Kind() const { return kind_; }

private:
    Kind_ kind_;
};

// wraps a failed filesystem or stream operation
class IoError_ : public Error_ {
public:
    explicit IoError_(const std::string& msg) : Error_(Kind_::IO, msg) {}
};

// template not found, template syntax, or render-time failure
class TemplateError_ : public Error_ {
public:
    explicit TemplateError_(const std::string& msg) : Error_(Kind_::TEMPLATE, msg) {}
};

class UnexpectedEof_ : public Error_ {
public:
    explicit UnexpectedEof_(const std::string& source)
        : Error_(Kind_::UNEXPECTED_EOF, "Unexpected end of file: " + source), source_(source) {}
    const std::string source_;
};

// the YAML decoder rejected the front matter
class DecodeError_ : public Error_ {
public:
    explicit DecodeError_(const std::string& detail)
        : Error_(Kind_::DECODE, "YAML deserialization failure: " + detail), detail_(detail) {}
    const std::string detail_;
};

// a numeric literal which fits neither int64 nor double
class UnrepresentableNumber_ : public Error_ {
public:
    explicit UnrepresentableNumber_(const std::string& literal)
        : Error_(Kind_::OTHER, "Unknown number format while parsing YAML: " + literal), literal_(literal) {}
    const std::string literal_;
};
