#include "reporter.hpp"
#include "handle.hpp"
#include <ostream>

ConsoleReporter_::ConsoleReporter_(Verbosity_ level, std::ostream& dst) : level_(level), dst_(dst) {}

void ConsoleReporter_::Info(const std::string& msg) const {
    if (level_ != Verbosity_::QUIET)
        dst_ << msg << "\n";
}

void ConsoleReporter_::Debug(const std::string& msg) const {
    if (level_ == Verbosity_::DEBUG)
        dst_ << "\t" << msg << "\n";
}

namespace {
    struct NullReporter_ : Reporter_ {
        void Info(const std::string&) const override {}
        void Debug(const std::string&) const override {}
    };
} // namespace

const Reporter_& Reporter::Null() {
    static const NullReporter_ RETVAL;
    return RETVAL;
}

Verbosity_ Reporter::ParseVerbosity(const std::string& name) {
    if (name == "quiet")
        return Verbosity_::QUIET;
    if (name == "info")
        return Verbosity_::INFO;
    if (name == "debug")
        return Verbosity_::DEBUG;
    THROW("Unrecognized verbosity '" + name + "'; expected quiet, info or debug");
}
