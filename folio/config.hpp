#pragma once

#include "handle.hpp"
#include "reporter.hpp"
#include <optional>

/* The configuration is resolved once, at the command line, and handed to the pipeline by const reference.
   Each setting comes from the first of:
        -- an explicit command-line flag
        -- an environment variable (FOLIO_SOURCE, FOLIO_DEST, FOLIO_BASE_URL, FOLIO_LOG)
        -- the built-in default

   The source directory is laid out as
        <source>/posts/       content documents
        <source>/templates/   *.html.inja
        <source>/assets/      copied verbatim
*/

struct Config_ {
    std::string sourceDir_;
    std::string destDir_;
    std::string baseUrl_; // prefixed, with a '/', to every post path
    Verbosity_ verbosity_ = Verbosity_::QUIET;
};

namespace Config {
    extern const std::string SOURCE_ENV;
    extern const std::string DEST_ENV;
    extern const std::string BASE_URL_ENV;
    extern const std::string LOG_ENV;

    struct Flags_ {
        std::optional<std::string> sourceDir_;
        std::optional<std::string> destDir_;
        std::optional<std::string> baseUrl_;
        bool verbose_ = false; // at least INFO
    };

    extern const std::string USAGE;

    // fills flags and the subcommand ("build" or "clean"); returns false if only help was requested
    bool ReadCommandLine(int argc, const char* const argv[], Flags_* flags, std::string* command);

    Config_ Resolve(const Flags_& flags);

    std::string PostsDir(const Config_& config);
    std::string TemplatesDir(const Config_& config);
    std::string AssetsDir(const Config_& config);
} // namespace Config
