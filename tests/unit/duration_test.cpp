#include "runtime/duration.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace linkerd_await::runtime;
using std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// Rejected input
// ---------------------------------------------------------------------------

TEST(DurationTest, RejectsEmptyAndBlank) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("  ").has_value());
    EXPECT_FALSE(parse_duration("\t\n").has_value());
}

TEST(DurationTest, RejectsMissingMagnitude) {
    EXPECT_FALSE(parse_duration("x").has_value());
    EXPECT_FALSE(parse_duration("s").has_value());
    EXPECT_FALSE(parse_duration("ms").has_value());
}

TEST(DurationTest, RejectsBarePositiveMagnitude) {
    EXPECT_FALSE(parse_duration("1").has_value());
    EXPECT_FALSE(parse_duration("250").has_value());
}

TEST(DurationTest, RejectsUnknownUnits) {
    EXPECT_FALSE(parse_duration("0x").has_value());
    EXPECT_FALSE(parse_duration("123x").has_value());
    EXPECT_FALSE(parse_duration("  123x  ").has_value());
    EXPECT_FALSE(parse_duration("10S").has_value());
    EXPECT_FALSE(parse_duration("10sec").has_value());
    EXPECT_FALSE(parse_duration("1.5s").has_value());
}

TEST(DurationTest, RejectsSignsAndInnerWhitespace) {
    EXPECT_FALSE(parse_duration("-1s").has_value());
    EXPECT_FALSE(parse_duration("+1s").has_value());
    EXPECT_FALSE(parse_duration("1 s").has_value());
}

TEST(DurationTest, RejectsOverflow) {
    const std::string u64_max = std::to_string(std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(parse_duration(u64_max + "s").has_value());
    EXPECT_FALSE(parse_duration(u64_max + "ms").has_value());
    EXPECT_FALSE(parse_duration("99999999999999999999999d").has_value());

    // Fits as a magnitude but not once scaled to milliseconds
    const std::string i64_max = std::to_string(std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(parse_duration(i64_max + "s").has_value());
}

// ---------------------------------------------------------------------------
// Accepted input
// ---------------------------------------------------------------------------

TEST(DurationTest, ZeroWithOrWithoutUnit) {
    EXPECT_EQ(parse_duration("0"), milliseconds(0));
    EXPECT_EQ(parse_duration("0s"), milliseconds(0));
    EXPECT_EQ(parse_duration("0ms"), milliseconds(0));
    EXPECT_EQ(parse_duration("000"), milliseconds(0));
}

TEST(DurationTest, EachUnit) {
    EXPECT_EQ(parse_duration("1ms"), milliseconds(1));
    EXPECT_EQ(parse_duration("1s"), std::chrono::seconds(1));
    EXPECT_EQ(parse_duration("10s"), std::chrono::seconds(10));
    EXPECT_EQ(parse_duration("10m"), std::chrono::minutes(10));
    EXPECT_EQ(parse_duration("10h"), std::chrono::hours(10));
    EXPECT_EQ(parse_duration("10d"), std::chrono::seconds(864000));
}

TEST(DurationTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(parse_duration(" \n12s  \t"), std::chrono::seconds(12));
    EXPECT_EQ(parse_duration("  500ms"), milliseconds(500));
}

TEST(DurationTest, LargestRepresentableMilliseconds) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(parse_duration(std::to_string(max) + "ms"), milliseconds(max));
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

TEST(DurationTest, FormatUsesLargestExactUnit) {
    EXPECT_EQ(format_duration(milliseconds(0)), "0s");
    EXPECT_EQ(format_duration(milliseconds(1500)), "1500ms");
    EXPECT_EQ(format_duration(std::chrono::seconds(30)), "30s");
    EXPECT_EQ(format_duration(std::chrono::seconds(90)), "90s");
    EXPECT_EQ(format_duration(std::chrono::minutes(2)), "2m");
    EXPECT_EQ(format_duration(std::chrono::hours(48)), "2d");
}

TEST(DurationTest, FormatParsesBack) {
    for (auto d : {milliseconds(1), milliseconds(999), milliseconds(61000), milliseconds(3600000)}) {
        EXPECT_EQ(parse_duration(format_duration(d)), d) << format_duration(d);
    }
}
