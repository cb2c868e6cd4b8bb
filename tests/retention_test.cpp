#include "backup/retention.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace dbsnap::backup {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────
// Entries are built by hand with exact modification times; each one is backed
// by a real file so deletion can be observed.

class RetentionTest : public ::testing::Test {
protected:
    SnapshotInfo add(const std::string& name, std::chrono::system_clock::duration age) {
        SnapshotInfo info;
        info.filename = name;
        info.path     = scratch_.path() / name;
        info.size     = 4;
        info.modified = now_ - age;
        info.created  = info.modified;
        test::write_file(info.path, "data");
        entries_.push_back(info);
        return info;
    }

    [[nodiscard]] static std::vector<std::string> names(const std::vector<SnapshotInfo>& v) {
        std::vector<std::string> out;
        for (const auto& e : v) out.push_back(e.filename);
        return out;
    }

    [[nodiscard]] static RetentionPolicy by_age(double days) {
        RetentionPolicy p;
        p.max_age_days = days;
        return p;
    }

    [[nodiscard]] static RetentionPolicy by_count(std::size_t count) {
        RetentionPolicy p;
        p.max_count = count;
        return p;
    }

    test::ScratchDir scratch_;
    const TimePoint now_{std::chrono::sys_days{std::chrono::year{2026} / 10 / 19} + 12h};
    std::vector<SnapshotInfo> entries_;
};

// ── Validation ───────────────────────────────────────────────────────────────

TEST_F(RetentionTest, NoCriterionIsConfigError) {
    add("a.db", 100 * 24h);
    EXPECT_THROW(validate_policy(RetentionPolicy{}), ConfigError);
    EXPECT_THROW((void)apply_retention(RetentionPolicy{}, entries_, now_), ConfigError);
    EXPECT_TRUE(fs::exists(scratch_.path() / "a.db"));
}

TEST_F(RetentionTest, NegativeAgeIsConfigError) {
    EXPECT_THROW(validate_policy(by_age(-1.0)), ConfigError);
}

TEST_F(RetentionTest, NanAgeIsConfigError) {
    EXPECT_THROW(validate_policy(by_age(std::numeric_limits<double>::quiet_NaN())), ConfigError);
}

TEST_F(RetentionTest, ZeroAgeIsConfigError) {
    add("fresh.db", 1ms);
    EXPECT_THROW(validate_policy(by_age(0.0)), ConfigError);
    EXPECT_THROW((void)apply_retention(by_age(0.0), entries_, now_), ConfigError);
    EXPECT_TRUE(fs::exists(scratch_.path() / "fresh.db"));
}

TEST_F(RetentionTest, AgeAboveMaximumIsConfigError) {
    add("ancient.db", 400 * 24h);
    EXPECT_NO_THROW(validate_policy(by_age(kMaxRetentionDays)));
    EXPECT_THROW(validate_policy(by_age(kMaxRetentionDays + 1.0)), ConfigError);
    EXPECT_THROW((void)apply_retention(by_age(1e300), entries_, now_), ConfigError);
    EXPECT_TRUE(fs::exists(scratch_.path() / "ancient.db"));
}

TEST_F(RetentionTest, MaximumAgeKeepsEverythingRecent) {
    add("ancient.db", 400 * 24h);
    EXPECT_TRUE(select_for_removal(by_age(kMaxRetentionDays), entries_, now_).empty());
}

TEST_F(RetentionTest, ZeroCountIsValid) {
    EXPECT_NO_THROW(validate_policy(by_count(0)));
}

// ── Age-based selection ──────────────────────────────────────────────────────

TEST_F(RetentionTest, AgeRemovesStrictlyOlderThanCutoff) {
    add("fresh.db", 1h);
    add("week.db", 7 * 24h - 1s);
    add("boundary.db", 7 * 24h);
    add("older.db", 7 * 24h + 1ns);
    add("ancient.db", 400 * 24h);

    const auto selected = select_for_removal(by_age(7), entries_, now_);
    EXPECT_EQ(names(selected), (std::vector<std::string>{"older.db", "ancient.db"}));
}

TEST_F(RetentionTest, FractionalDays) {
    add("eleven-hours.db", 11h);
    add("thirteen-hours.db", 13h);

    const auto selected = select_for_removal(by_age(0.5), entries_, now_);
    EXPECT_EQ(names(selected), (std::vector<std::string>{"thirteen-hours.db"}));
}

TEST_F(RetentionTest, AgeDeletesSelectedFiles) {
    add("keep.db", 1h);
    add("drop.db", 40 * 24h);

    const auto result = apply_retention(by_age(30), entries_, now_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.removed_files, (std::vector<std::string>{"drop.db"}));
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.total_files, 2u);
    EXPECT_EQ(result.remaining_files, 1u);
    EXPECT_TRUE(fs::exists(scratch_.path() / "keep.db"));
    EXPECT_FALSE(fs::exists(scratch_.path() / "drop.db"));
}

TEST_F(RetentionTest, AgeWinsOverCount) {
    add("a.db", 1h);
    add("b.db", 2h);
    add("c.db", 3h);

    RetentionPolicy policy;
    policy.max_age_days = 30;
    policy.max_count    = 1;

    const auto result = apply_retention(policy, entries_, now_);
    EXPECT_EQ(result.removed, 0u);
    EXPECT_EQ(result.remaining_files, 3u);
}

// ── Count-based selection ────────────────────────────────────────────────────

TEST_F(RetentionTest, CountKeepsNewest) {
    add("d.db", 4h);
    add("a.db", 1h);
    add("e.db", 5h);
    add("b.db", 2h);
    add("c.db", 3h);

    const auto result = apply_retention(by_count(3), entries_, now_);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.remaining_files, 3u);
    EXPECT_EQ(result.removed_files, (std::vector<std::string>{"d.db", "e.db"}));
    for (const char* kept : {"a.db", "b.db", "c.db"}) {
        EXPECT_TRUE(fs::exists(scratch_.path() / kept)) << kept;
    }
}

TEST_F(RetentionTest, CountAboveTotalRemovesNothing) {
    add("a.db", 1h);
    add("b.db", 2h);
    const auto result = apply_retention(by_count(5), entries_, now_);
    EXPECT_EQ(result.removed, 0u);
    EXPECT_EQ(result.remaining_files, 2u);
}

TEST_F(RetentionTest, CountZeroRemovesAll) {
    add("a.db", 1h);
    add("b.db", 2h);
    const auto result = apply_retention(by_count(0), entries_, now_);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.remaining_files, 0u);
}

TEST_F(RetentionTest, EqualTimestampsBreakTiesByFilename) {
    add("snap-a.db", 1h);
    add("snap-c.db", 1h);
    add("snap-b.db", 1h);

    const auto selected = select_for_removal(by_count(1), entries_, now_);
    EXPECT_EQ(names(selected), (std::vector<std::string>{"snap-b.db", "snap-a.db"}));

    std::reverse(entries_.begin(), entries_.end());
    EXPECT_EQ(names(select_for_removal(by_count(1), entries_, now_)), names(selected));
}

TEST_F(RetentionTest, EmptyCatalog) {
    const auto result = apply_retention(by_count(1), entries_, now_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.total_files, 0u);
    EXPECT_EQ(result.remaining_files, 0u);
}

// ── Partial failure ──────────────────────────────────────────────────────────

TEST_F(RetentionTest, VanishedFileIsRecordedAndOthersRemoved) {
    add("a.db", 1h);
    add("b.db", 2h);
    add("c.db", 3h);
    add("d.db", 4h);
    fs::remove(scratch_.path() / "c.db");

    const auto result = apply_retention(by_count(1), entries_, now_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.removed_files, (std::vector<std::string>{"b.db", "d.db"}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("Failed to remove c.db"), std::string::npos);
    EXPECT_EQ(result.remaining_files, 2u);
    EXPECT_FALSE(fs::exists(scratch_.path() / "d.db"));
}

TEST_F(RetentionTest, UndeletableEntryIsRecordedAndOthersRemoved) {
    add("a.db", 1h);
    add("b.db", 2h);
    add("c.db", 3h);

    // A non-empty directory cannot be unlinked, whatever the privileges.
    fs::remove(scratch_.path() / "b.db");
    fs::create_directories(scratch_.path() / "b.db" / "inner");

    const auto result = apply_retention(by_count(0), entries_, now_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.removed_files, (std::vector<std::string>{"a.db", "c.db"}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("b.db"), std::string::npos);
    EXPECT_EQ(result.remaining_files, 1u);
    EXPECT_TRUE(fs::exists(scratch_.path() / "b.db"));
}

} // namespace dbsnap::backup
