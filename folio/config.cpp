#include "config.hpp"
#include "file.hpp"
#include "parseutils.hpp"
#include <map>

const std::string Config::SOURCE_ENV("FOLIO_SOURCE");
const std::string Config::DEST_ENV("FOLIO_DEST");
const std::string Config::BASE_URL_ENV("FOLIO_BASE_URL");
const std::string Config::LOG_ENV("FOLIO_LOG");

const std::string Config::USAGE("usage: folio [-s DIR] [-o DIR] [-u URL] [-v] (build|clean)\n"
                                "  -s, --source DIR     directory containing posts, templates and assets\n"
                                "  -o, --dest DIR       directory where output will be stored\n"
                                "  -u, --base-url URL   prefix for post links\n"
                                "  -v, --verbose        report progress\n");

namespace {
    const std::string DEFAULT_SOURCE("source/");
    const std::string DEFAULT_DEST("build/");

    std::string Choose(const std::optional<std::string>& flag, const std::string& env, const std::string& fallback) {
        return flag ? *flag : EnvironmentValue(env, fallback);
    }

    char ShortSwitch(const std::string& arg) {
        static const std::map<std::string, char> LONG = {
            {"--source", 's'}, {"--dest", 'o'}, {"--base-url", 'u'}, {"--verbose", 'v'}, {"--help", 'h'}};
        if (auto pl = LONG.find(arg); pl != LONG.end())
            return pl->second;
        REQUIRE(arg.size() == 2, "Unrecognized command line switch " + arg);
        return arg[1];
    }
} // namespace

bool Config::ReadCommandLine(int argc, const char* const argv[], Flags_* flags, std::string* command) {
    for (int ii = 1; ii < argc; ++ii) {
        std::string arg(argv[ii]);
        REQUIRE(!arg.empty(), "Empty command line argument");
        if (arg[0] == '-') {
            switch (ShortSwitch(arg)) {
            case 's':
                REQUIRE(ii + 1 < argc, arg + " must be followed by a source directory");
                flags->sourceDir_ = argv[++ii]; // jump forward to this input
                break;

            case 'o':
                REQUIRE(ii + 1 < argc, arg + " must be followed by a destination directory");
                flags->destDir_ = argv[++ii];
                break;

            case 'u':
                REQUIRE(ii + 1 < argc, arg + " must be followed by a base URL");
                flags->baseUrl_ = argv[++ii];
                break;

            case 'v':
                flags->verbose_ = true;
                break;

            case 'h':
                return false;

            default:
                THROW("Unrecognized command line switch " + arg);
            }
        } else {
            REQUIRE(arg == "build" || arg == "clean", "Unknown subcommand '" + arg + "'");
            REQUIRE(command->empty(), "Can't supply multiple subcommands");
            *command = arg;
        }
    }
    REQUIRE(!command->empty(), "A subcommand is required: build or clean");
    return true;
}

Config_ Config::Resolve(const Flags_& flags) {
    Config_ ret_val;
    ret_val.sourceDir_ = Choose(flags.sourceDir_, SOURCE_ENV, DEFAULT_SOURCE);
    ret_val.destDir_ = Choose(flags.destDir_, DEST_ENV, DEFAULT_DEST);
    ret_val.baseUrl_ = Choose(flags.baseUrl_, BASE_URL_ENV, std::string());
    REQUIRE(!ret_val.sourceDir_.empty(), "Source directory cannot be empty");
    REQUIRE(!ret_val.destDir_.empty(), "Destination directory cannot be empty");

    const std::string level = ParseUtils::TrimWhitespace(EnvironmentValue(LOG_ENV, std::string()));
    ret_val.verbosity_ = level.empty() ? Verbosity_::QUIET : Reporter::ParseVerbosity(level);
    if (flags.verbose_ && ret_val.verbosity_ == Verbosity_::QUIET)
        ret_val.verbosity_ = Verbosity_::INFO;
    return ret_val;
}

std::string Config::PostsDir(const Config_& config) { return File::Join(config.sourceDir_, "posts"); }
std::string Config::TemplatesDir(const Config_& config) { return File::Join(config.sourceDir_, "templates"); }
std::string Config::AssetsDir(const Config_& config) { return File::Join(config.sourceDir_, "assets"); }
