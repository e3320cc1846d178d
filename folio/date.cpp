#include "date.hpp"
#include "handle.hpp"
#include <ctime>
#include <regex>
#include <vector>

namespace {
    bool IsLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    int DaysInMonth(int y, int m) {
        static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return m == 2 && IsLeap(y) ? 29 : DAYS[m - 1];
    }

    // proleptic Gregorian day count relative to 1970-01-01
    std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    struct Stamp_ {
        std::int64_t utc_;   // seconds since epoch
        int offset_;         // seconds east of UTC, as written
    };

    std::optional<Stamp_> ParseStamp(const std::string& text) {
        static const std::regex DATE_ONLY("([0-9]{4})-([0-9]{2})-([0-9]{2})");
        static const std::regex FULL("([0-9]{4})-([0-9]{2})-([0-9]{2})[Tt ]([0-9]{2}):([0-9]{2}):([0-9]{2})(\\.[0-9]+)?"
                                     "(Z|z|[+-][0-9]{2}:[0-9]{2})");
        std::smatch what;
        const bool full = std::regex_match(text, what, FULL);
        if (!full && !std::regex_match(text, what, DATE_ONLY))
            return std::nullopt;
        const int y = std::stoi(what[1]), mo = std::stoi(what[2]), d = std::stoi(what[3]);
        if (mo < 1 || mo > 12 || d < 1 || d > DaysInMonth(y, mo))
            return std::nullopt;
        int h = 0, mi = 0, s = 0, offset = 0;
        if (full) {
            h = std::stoi(what[4]);
            mi = std::stoi(what[5]);
            s = std::stoi(what[6]);
            if (h > 23 || mi > 59 || s > 60)
                return std::nullopt;
            const std::string zone = what[8];
            if (zone != "Z" && zone != "z") {
                const int oh = std::stoi(zone.substr(1, 2)), om = std::stoi(zone.substr(4, 2));
                if (oh > 23 || om > 59)
                    return std::nullopt;
                offset = (zone[0] == '-' ? -1 : 1) * (oh * 3600 + om * 60);
            }
        }
        const std::int64_t local = DaysFromCivil(y, mo, d) * 86400 + h * 3600 + mi * 60 + s;
        return Stamp_{local - offset, offset};
    }

    std::tm ToTm(std::int64_t seconds) {
        const std::time_t t = static_cast<std::time_t>(seconds);
        std::tm retval{};
#ifdef _WIN32
        gmtime_s(&retval, &t);
#else
        gmtime_r(&t, &retval);
#endif
        return retval;
    }
} // namespace

std::optional<std::int64_t> Date::Parse(const std::string& text) {
    if (auto stamp = ParseStamp(text))
        return stamp->utc_;
    return std::nullopt;
}

std::optional<std::int64_t> Date::FromPrefix(const std::string& text) {
    if (text.size() < 10)
        return std::nullopt;
    return Parse(text.substr(0, 10));
}

std::string Date::Iso8601(std::int64_t seconds) {
    const std::tm tm = ToTm(seconds);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return std::string(buf);
}

std::string Date::Format(const std::string& iso_text, const std::string& pattern) {
    auto stamp = ParseStamp(iso_text);
    REQUIRE(stamp, "Could not parse as datetime: " + iso_text);
    const std::tm tm = ToTm(stamp->utc_ + stamp->offset_);
    if (pattern.empty())
        return std::string();
    // strftime reports a short buffer only as zero output
    static const size_t MAX_BUFFER = 1 << 16;
    std::vector<char> buf(256 + 2 * pattern.size());
    for (;;) {
        const size_t n = std::strftime(buf.data(), buf.size(), pattern.c_str(), &tm);
        if (n > 0)
            return std::string(buf.data(), n);
        REQUIRE(buf.size() < MAX_BUFFER, "Date format produced no output: " + pattern);
        buf.resize(buf.size() * 2);
    }
}
