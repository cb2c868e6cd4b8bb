#include "engine/sqlite_engine.hpp"

#include <memory>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace dbsnap::engine {

namespace {

class SqliteCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "sqlite"; }

    std::string message(int ev) const override {
        return ::sqlite3_errstr(ev);
    }
};

// ── RAII handles ─────────────────────────────────────────────────────────────

struct ConnectionCloser {
    void operator()(sqlite3* db) const noexcept { ::sqlite3_close_v2(db); }
};

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { ::sqlite3_finalize(stmt); }
};

using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
using Statement  = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

[[nodiscard]] std::error_code sqlite_error(int rc) {
    return {rc, sqlite_category()};
}

// Open `path` with `flags`.  On failure `conn` may still hold a handle (SQLite
// allocates one to carry the error message); it is released by the caller's
// unique_ptr either way.
[[nodiscard]] std::error_code open_connection(const std::filesystem::path& path,
                                              int flags, Connection& conn) {
    sqlite3* raw = nullptr;
    const int rc = ::sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    conn.reset(raw);
    if (rc != SQLITE_OK) {
        spdlog::debug("SqliteEngine: cannot open {}: {}", path.string(),
                      raw ? ::sqlite3_errmsg(raw) : ::sqlite3_errstr(rc));
        return sqlite_error(rc);
    }
    ::sqlite3_busy_timeout(raw, SqliteEngine::kBusyTimeoutMs);
    return {};
}

[[nodiscard]] std::error_code open_source(const std::filesystem::path& source,
                                          Connection& conn) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return open_connection(source, SQLITE_OPEN_READONLY, conn);
}

} // anonymous namespace

const std::error_category& sqlite_category() noexcept {
    static const SqliteCategory category;
    return category;
}

// ── hot_copy ─────────────────────────────────────────────────────────────────

std::error_code SqliteEngine::hot_copy(const std::filesystem::path& source,
                                       const std::filesystem::path& target) {
    Connection src;
    if (auto ec = open_source(source, src)) {
        return ec;
    }

    Connection dst;
    if (auto ec = open_connection(target, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, dst)) {
        spdlog::warn("SqliteEngine: cannot create {}: {}", target.string(), ec.message());
        return ec;
    }

    sqlite3_backup* backup = ::sqlite3_backup_init(dst.get(), "main", src.get(), "main");
    if (backup == nullptr) {
        const int rc = ::sqlite3_errcode(dst.get());
        spdlog::warn("SqliteEngine: backup init {} -> {} failed: {}",
                     source.string(), target.string(), ::sqlite3_errmsg(dst.get()));
        return sqlite_error(rc);
    }

    int rc = SQLITE_OK;
    do {
        rc = ::sqlite3_backup_step(backup, kBackupPagesPerStep);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            ::sqlite3_sleep(kBusyRetryDelayMs);
        }
    } while (rc == SQLITE_OK || rc == SQLITE_BUSY || rc == SQLITE_LOCKED);

    const int finish_rc = ::sqlite3_backup_finish(backup);
    if (rc != SQLITE_DONE) {
        spdlog::warn("SqliteEngine: backup {} -> {} failed: {}",
                     source.string(), target.string(), ::sqlite3_errstr(rc));
        return sqlite_error(rc);
    }
    if (finish_rc != SQLITE_OK) {
        spdlog::warn("SqliteEngine: backup finish failed: {}", ::sqlite3_errmsg(dst.get()));
        return sqlite_error(finish_rc);
    }

    // Close explicitly so a failed final flush is reported, not swallowed by
    // the deleter.
    const int close_rc = ::sqlite3_close(dst.get());
    if (close_rc != SQLITE_OK) {
        spdlog::warn("SqliteEngine: closing {} failed: {}", target.string(),
                     ::sqlite3_errstr(close_rc));
        return sqlite_error(close_rc);
    }
    (void)dst.release();
    return {};
}

// ── compact_copy ─────────────────────────────────────────────────────────────

std::error_code SqliteEngine::compact_copy(const std::filesystem::path& source,
                                           const std::filesystem::path& target) {
    Connection src;
    if (auto ec = open_source(source, src)) {
        return ec;
    }

    sqlite3_stmt* raw_stmt = nullptr;
    int rc = ::sqlite3_prepare_v2(src.get(), "VACUUM INTO ?1", -1, &raw_stmt, nullptr);
    Statement stmt{raw_stmt};
    if (rc != SQLITE_OK) {
        spdlog::warn("SqliteEngine: cannot prepare VACUUM INTO on {}: {}",
                     source.string(), ::sqlite3_errmsg(src.get()));
        return sqlite_error(rc);
    }

    const std::string target_str = target.string();
    rc = ::sqlite3_bind_text(stmt.get(), 1, target_str.c_str(),
                             static_cast<int>(target_str.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return sqlite_error(rc);
    }

    rc = ::sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        spdlog::warn("SqliteEngine: VACUUM INTO {} failed: {}", target_str,
                     ::sqlite3_errmsg(src.get()));
        return sqlite_error(rc);
    }
    return {};
}

// ── integrity_check ──────────────────────────────────────────────────────────

std::optional<std::vector<std::string>> SqliteEngine::integrity_check(
    const std::filesystem::path& path) {
    Connection db;
    if (open_connection(path, SQLITE_OPEN_READONLY, db)) {
        return std::nullopt;
    }

    sqlite3_stmt* raw_stmt = nullptr;
    int rc = ::sqlite3_prepare_v2(db.get(), "PRAGMA integrity_check", -1, &raw_stmt, nullptr);
    Statement stmt{raw_stmt};
    if (rc != SQLITE_OK) {
        spdlog::debug("SqliteEngine: integrity_check on {} not runnable: {}",
                      path.string(), ::sqlite3_errmsg(db.get()));
        return std::nullopt;
    }

    std::vector<std::string> rows;
    while ((rc = ::sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const auto* text = ::sqlite3_column_text(stmt.get(), 0);
        rows.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
    }
    if (rc != SQLITE_DONE) {
        spdlog::debug("SqliteEngine: integrity_check on {} aborted: {}",
                      path.string(), ::sqlite3_errmsg(db.get()));
        return std::nullopt;
    }
    return rows;
}

} // namespace dbsnap::engine
