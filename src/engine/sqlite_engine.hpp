#pragma once

#include "engine/database_engine.hpp"

#include <system_error>

namespace dbsnap::engine {

// Error category for SQLite primary/extended result codes.
// message() is sqlite3_errstr(code).
[[nodiscard]] const std::error_category& sqlite_category() noexcept;

// ── SqliteEngine ────────────────────────────────────────────────────────────
//
// DatabaseEngine backed by the SQLite C API.
//
//   hot_copy        – online backup API (sqlite3_backup_*), retried while the
//                     source is busy or locked by another connection
//   compact_copy    – VACUUM INTO
//   integrity_check – PRAGMA integrity_check on a read-only connection
//
// Every call opens and closes its own connections; nothing is cached between
// calls, so the engine is safe to use from several threads at once.

class SqliteEngine final : public DatabaseEngine {
public:
    // Pages copied per sqlite3_backup_step() call.
    static constexpr int kBackupPagesPerStep = 500;
    // Sleep between steps while the source is busy (milliseconds).
    static constexpr int kBusyRetryDelayMs = 100;
    // Busy handler timeout for read connections (milliseconds).
    static constexpr int kBusyTimeoutMs = 5000;

    [[nodiscard]] std::error_code hot_copy(const std::filesystem::path& source,
                                           const std::filesystem::path& target) override;

    [[nodiscard]] std::error_code compact_copy(const std::filesystem::path& source,
                                               const std::filesystem::path& target) override;

    [[nodiscard]] std::optional<std::vector<std::string>> integrity_check(
        const std::filesystem::path& path) override;
};

} // namespace dbsnap::engine
