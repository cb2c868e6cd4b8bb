#include "backup/integrity_verifier.hpp"
#include "engine/sqlite_engine.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace dbsnap::backup {

namespace fs = std::filesystem;

// ── Fixture ──────────────────────────────────────────────────────────────────

class IntegrityVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = scratch_.path() / "app.db";
        test::create_database(db_);
    }

    test::ScratchDir scratch_;
    fs::path db_;
    engine::SqliteEngine engine_;
    IntegrityVerifier verifier_{engine_};
};

// ── Healthy files ────────────────────────────────────────────────────────────

TEST_F(IntegrityVerifierTest, ValidDatabasePasses) {
    EXPECT_TRUE(verifier_.verify(db_));
}

TEST_F(IntegrityVerifierTest, FreshSnapshotPasses) {
    const auto snap = scratch_.path() / "snap.db";
    ASSERT_FALSE(engine_.hot_copy(db_, snap));
    EXPECT_TRUE(verifier_.verify(snap));
}

// ── Fail-closed cases ────────────────────────────────────────────────────────

TEST_F(IntegrityVerifierTest, MissingFileFails) {
    EXPECT_FALSE(verifier_.verify(scratch_.path() / "missing.db"));
}

TEST_F(IntegrityVerifierTest, ZeroByteFileFails) {
    const auto empty = scratch_.path() / "empty.db";
    test::write_file(empty, "");
    EXPECT_FALSE(verifier_.verify(empty));
}

TEST_F(IntegrityVerifierTest, CorruptedHeaderFails) {
    test::corrupt_header(db_);
    EXPECT_FALSE(verifier_.verify(db_));
}

TEST_F(IntegrityVerifierTest, TruncatedFileFails) {
    const auto truncated = scratch_.path() / "truncated.db";
    test::write_file(truncated, test::read_file(db_).substr(0, 50));
    EXPECT_FALSE(verifier_.verify(truncated));
}

TEST_F(IntegrityVerifierTest, DirectoryFails) {
    EXPECT_FALSE(verifier_.verify(scratch_.path()));
}

TEST_F(IntegrityVerifierTest, EngineThatCannotRunFails) {
    test::FakeEngine fake;
    fake.integrity_output = std::optional<std::vector<std::string>>{};
    IntegrityVerifier verifier{fake};
    EXPECT_FALSE(verifier.verify(db_));
    EXPECT_EQ(fake.integrity_check_calls, 1);
}

TEST_F(IntegrityVerifierTest, ProblemRowsFail) {
    test::FakeEngine fake;
    fake.integrity_output = std::vector<std::string>{"*** in database main ***",
                                                     "Page 3 is never used"};
    IntegrityVerifier verifier{fake};
    EXPECT_FALSE(verifier.verify(db_));
}

TEST_F(IntegrityVerifierTest, SingleNonOkRowFails) {
    test::FakeEngine fake;
    fake.integrity_output = std::vector<std::string>{"OK"};
    IntegrityVerifier verifier{fake};
    EXPECT_FALSE(verifier.verify(db_));
}

TEST_F(IntegrityVerifierTest, EmptyOutputFails) {
    test::FakeEngine fake;
    fake.integrity_output = std::vector<std::string>{};
    IntegrityVerifier verifier{fake};
    EXPECT_FALSE(verifier.verify(db_));
}

TEST_F(IntegrityVerifierTest, HeaderCheckSkipsEngineForNonDatabases) {
    test::FakeEngine fake;
    IntegrityVerifier verifier{fake};
    EXPECT_FALSE(verifier.verify(scratch_.path() / "missing.db"));
    EXPECT_EQ(fake.integrity_check_calls, 0);
}

// ── has_database_header ──────────────────────────────────────────────────────

TEST_F(IntegrityVerifierTest, HeaderDetection) {
    EXPECT_TRUE(IntegrityVerifier::has_database_header(db_));

    const auto text = scratch_.path() / "notes.db";
    test::write_file(text, std::string(200, 'n'));
    EXPECT_FALSE(IntegrityVerifier::has_database_header(text));
}

} // namespace dbsnap::backup
