#include "date.hpp"
#include "handle.hpp"
#include <gtest/gtest.h>

TEST(DateTest, ParsesUtcTimestamps) {
    EXPECT_EQ(Date::Parse("2023-02-04T15:38:42Z"), std::optional<std::int64_t>(1675525122));
    EXPECT_EQ(Date::Parse("2023-02-04 15:38:42z"), std::optional<std::int64_t>(1675525122));
    EXPECT_EQ(Date::Parse("2023-02-04T15:38:42.250Z"), std::optional<std::int64_t>(1675525122));
    EXPECT_EQ(Date::Parse("1970-01-01T00:00:00+00:00"), std::optional<std::int64_t>(0));
}

TEST(DateTest, AppliesOffsets) {
    EXPECT_EQ(Date::Parse("2023-02-04T17:38:42+02:00"), std::optional<std::int64_t>(1675525122));
    EXPECT_EQ(Date::Parse("2023-02-04T10:08:42-05:30"), std::optional<std::int64_t>(1675525122));
}

TEST(DateTest, BareDateIsMidnightUtc) {
    EXPECT_EQ(Date::Parse("2024-01-01"), std::optional<std::int64_t>(1704067200));
    EXPECT_EQ(Date::Parse("2024-06-01"), std::optional<std::int64_t>(1717200000));
}

TEST(DateTest, RejectsMalformedOrImpossibleDates) {
    EXPECT_FALSE(Date::Parse(""));
    EXPECT_FALSE(Date::Parse("yesterday"));
    EXPECT_FALSE(Date::Parse("2024-13-01"));
    EXPECT_FALSE(Date::Parse("2023-02-29"));
    EXPECT_FALSE(Date::Parse("2024-04-31"));
    EXPECT_FALSE(Date::Parse("2024-01-01T24:00:00Z"));
    EXPECT_FALSE(Date::Parse("2024-01-01T12:00:00")); // no zone
    EXPECT_FALSE(Date::Parse("2024-1-1"));
    EXPECT_TRUE(Date::Parse("2024-02-29"));
    EXPECT_TRUE(Date::Parse("2000-02-29"));
    EXPECT_FALSE(Date::Parse("1900-02-29"));
}

TEST(DateTest, FromPrefixLooksAtTenCharacters) {
    EXPECT_EQ(Date::FromPrefix("2024-06-01-summer.html"), std::optional<std::int64_t>(1717200000));
    EXPECT_FALSE(Date::FromPrefix("notes/2024-06-01.html"));
    EXPECT_FALSE(Date::FromPrefix("2024-06"));
    EXPECT_FALSE(Date::FromPrefix("2024-06-xx-foo.html"));
}

TEST(DateTest, Iso8601IsUtc) {
    EXPECT_EQ(Date::Iso8601(1717200000), "2024-06-01T00:00:00+00:00");
    EXPECT_EQ(Date::Iso8601(1675525122), "2023-02-04T15:38:42+00:00");
    EXPECT_EQ(Date::Parse(Date::Iso8601(1675525122)), std::optional<std::int64_t>(1675525122));
}

TEST(DateTest, FormatUsesTheWrittenOffset) {
    EXPECT_EQ(Date::Format("2023-02-04T15:38:42Z", "%Y/%m/%d %H:%M"), "2023/02/04 15:38");
    EXPECT_EQ(Date::Format("2023-02-04T23:30:00+02:00", "%d %H"), "04 23");
    EXPECT_EQ(Date::Format("2024-06-01", "%B %e"), "June  1");
}

TEST(DateTest, LongPatternsAreNotTruncated) {
    std::string pattern, expected;
    for (int ii = 0; ii < 1000; ++ii) {
        pattern += "%F";
        expected += "2023-02-04";
    }
    EXPECT_EQ(Date::Format("2023-02-04T15:38:42Z", pattern), expected);
    EXPECT_EQ(Date::Format("2023-02-04T15:38:42Z", ""), "");
}

TEST(DateTest, FormatRejectsUnparseableText) {
    try {
        Date::Format("soon", "%Y");
        FAIL() << "Expected an error";
    } catch (const Error_& e) {
        EXPECT_EQ(std::string(e.what()), "Could not parse as datetime: soon");
    }
}
