#pragma once

#include <iosfwd>
#include <string>

// progress reporting is injected; nothing in the pipeline writes to the console directly

class Reporter_ {
public:
    virtual ~Reporter_() = default;
    virtual void Info(const std::string& msg) const = 0;
    virtual void Debug(const std::string& msg) const = 0;
};

enum class Verbosity_ { QUIET, INFO, DEBUG };

class ConsoleReporter_ : public Reporter_ {
public:
    ConsoleReporter_(Verbosity_ level, std::ostream& dst);
    void Info(const std::string& msg) const override;
    void Debug(const std::string& msg) const override;

private:
    Verbosity_ level_;
    std::ostream& dst_;
};

namespace Reporter {
    const Reporter_& Null(); // discards everything
    Verbosity_ ParseVerbosity(const std::string& name); // "quiet", "info" or "debug"
} // namespace Reporter
