#pragma once

#include "engine/database_engine.hpp"
#include "engine/sqlite_engine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sqlite3.h>

#include <gtest/gtest.h>

namespace dbsnap::test {

namespace fs = std::filesystem;

// ── Scratch directory ────────────────────────────────────────────────────────
// Per-test directory under the system temp dir, removed on destruction.

class ScratchDir {
public:
    ScratchDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string{"dbsnap_"} + info->test_suite_name() + "_" + info->name();
        std::replace(name.begin(), name.end(), '/', '_');  // parameterised names
        path_ = fs::temp_directory_path() / name;
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&)            = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// ── Database helpers ─────────────────────────────────────────────────────────

inline void exec_sql(const fs::path& db_path, const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    const std::string message = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

// Database with one table `items` holding `rows` rows.
inline void create_database(const fs::path& db_path, int rows = 2) {
    exec_sql(db_path, "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT NOT NULL)");
    for (int i = 0; i < rows; ++i) {
        exec_sql(db_path, "INSERT INTO items (name) VALUES ('item" + std::to_string(i) + "')");
    }
}

// Number of rows in `items`, or -1 if the query fails.
inline int count_rows(const fs::path& db_path) {
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(db_path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return -1;
    }
    sqlite3_stmt* stmt = nullptr;
    int count = -1;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM items", -1, &stmt, nullptr) == SQLITE_OK &&
        sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return count;
}

// ── File helpers ─────────────────────────────────────────────────────────────

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Overwrite the first bytes of `path` (the SQLite header) with garbage.
inline void corrupt_header(const fs::path& path) {
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    const std::string garbage(32, '\x5A');
    f.seekp(0);
    f.write(garbage.data(), static_cast<std::streamsize>(garbage.size()));
}

inline void set_mtime(const fs::path& path, std::chrono::system_clock::time_point tp) {
    fs::last_write_time(path, std::chrono::file_clock::from_sys(tp));
}

// ── FakeEngine ───────────────────────────────────────────────────────────────
// Delegates to SqliteEngine unless a failure or canned output is configured.

class FakeEngine final : public engine::DatabaseEngine {
public:
    std::error_code hot_copy_error;
    std::error_code compact_copy_error;
    std::optional<std::optional<std::vector<std::string>>> integrity_output;

    int hot_copy_calls        = 0;
    int integrity_check_calls = 0;

    std::error_code hot_copy(const fs::path& source, const fs::path& target) override {
        ++hot_copy_calls;
        if (hot_copy_error) return hot_copy_error;
        return real_.hot_copy(source, target);
    }

    std::error_code compact_copy(const fs::path& source, const fs::path& target) override {
        if (compact_copy_error) return compact_copy_error;
        return real_.compact_copy(source, target);
    }

    std::optional<std::vector<std::string>> integrity_check(const fs::path& path) override {
        ++integrity_check_calls;
        if (integrity_output) return *integrity_output;
        return real_.integrity_check(path);
    }

private:
    engine::SqliteEngine real_;
};

} // namespace dbsnap::test
