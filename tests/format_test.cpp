#include "common/format.hpp"

#include <chrono>

#include <gtest/gtest.h>

namespace dbsnap {

using namespace std::chrono;

// ── format_size ───────────────────────────────────────────────────────────────

TEST(FormatSizeTest, ZeroBytes) {
    EXPECT_EQ(format_size(0), "0 B");
}

TEST(FormatSizeTest, BytesBelowOneKilobyte) {
    EXPECT_EQ(format_size(512), "512.00 B");
}

TEST(FormatSizeTest, Kilobytes) {
    EXPECT_EQ(format_size(1024), "1.00 KB");
    EXPECT_EQ(format_size(1536), "1.50 KB");
}

TEST(FormatSizeTest, Megabytes) {
    EXPECT_EQ(format_size(5ull * 1024 * 1024), "5.00 MB");
}

TEST(FormatSizeTest, CapsAtTerabytes) {
    EXPECT_EQ(format_size(2048ull * 1024 * 1024 * 1024 * 1024), "2048.00 TB");
}

// ── format_duration ───────────────────────────────────────────────────────────

TEST(FormatDurationTest, Milliseconds) {
    EXPECT_EQ(format_duration(milliseconds{0}), "0ms");
    EXPECT_EQ(format_duration(milliseconds{999}), "999ms");
}

TEST(FormatDurationTest, Seconds) {
    EXPECT_EQ(format_duration(milliseconds{1000}), "1.00s");
    EXPECT_EQ(format_duration(milliseconds{1250}), "1.25s");
}

TEST(FormatDurationTest, Minutes) {
    EXPECT_EQ(format_duration(milliseconds{60000}), "1.00m");
    EXPECT_EQ(format_duration(milliseconds{150000}), "2.50m");
}

// ── iso8601_utc ───────────────────────────────────────────────────────────────

TEST(Iso8601Test, Epoch) {
    EXPECT_EQ(iso8601_utc(system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(Iso8601Test, MillisecondPrecision) {
    // 2021-03-04T05:06:07.089Z
    const system_clock::time_point tp{seconds{1614834367} + milliseconds{89}};
    EXPECT_EQ(iso8601_utc(tp), "2021-03-04T05:06:07.089Z");
}

TEST(Iso8601Test, SubMillisecondsTruncated) {
    const system_clock::time_point tp{seconds{1614834367} + microseconds{89999}};
    EXPECT_EQ(iso8601_utc(tp), "2021-03-04T05:06:07.089Z");
}

} // namespace dbsnap
