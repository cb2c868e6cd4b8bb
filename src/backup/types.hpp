#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace dbsnap::backup {

using TimePoint = std::chrono::system_clock::time_point;

// Extension carried by every snapshot file.
inline constexpr std::string_view kSnapshotExtension = ".db";

// Default catalog pattern.
inline constexpr std::string_view kDefaultPattern = "*.db";

// ── ManagerConfig ─────────────────────────────────────────────────────────────
//
// Resolved, immutable configuration of one BackupManager.  The manager's
// constructor fills in defaults, makes both paths absolute and validates them;
// after that the values never change.

struct ManagerConfig {
    std::filesystem::path database_path;       // Live database file (must exist)
    std::filesystem::path snapshot_directory;  // Empty: <database dir>/backups
    bool auto_create_directory = true;         // mkdir -p the snapshot directory
};

// ── SnapshotStrategy ──────────────────────────────────────────────────────────

enum class SnapshotStrategy : uint8_t {
    NativeCopy  = 0,  // engine online backup, safe against concurrent writers
    RawCopy     = 1,  // plain file copy, source must be quiescent
    CompactCopy = 2,  // engine rewrite without free pages
};

// CLI names: "backup", "copy", "vacuum".
[[nodiscard]] std::string_view to_string(SnapshotStrategy strategy);
[[nodiscard]] std::optional<SnapshotStrategy> parse_strategy(std::string_view name);

// ── Snapshot creation ─────────────────────────────────────────────────────────

struct SnapshotRequest {
    std::optional<std::string> filename;  // ".db" appended when missing
    bool include_timestamp   = true;
    bool verify_after_create = true;
    SnapshotStrategy strategy = SnapshotStrategy::NativeCopy;
};

struct SnapshotCreated {
    std::filesystem::path path;
    std::string filename;
    std::uintmax_t size = 0;
    std::optional<std::string> checksum;  // SHA-256 hex, nullopt if unreadable
    std::chrono::milliseconds duration{0};
    std::string timestamp;                // ISO-8601 UTC
    SnapshotStrategy strategy = SnapshotStrategy::NativeCopy;
};

struct OperationFailure {
    std::error_code error;
    std::string message;
    std::string timestamp;                // ISO-8601 UTC
};

using SnapshotResult = std::variant<SnapshotCreated, OperationFailure>;

// ── Catalog ───────────────────────────────────────────────────────────────────

struct SnapshotInfo {
    std::string filename;
    std::filesystem::path path;
    std::uintmax_t size = 0;
    TimePoint created;
    TimePoint modified;
    std::optional<bool> valid;            // set only when checksums requested
    std::optional<std::string> checksum;  // set only when checksums requested
};

struct ListRequest {
    std::string pattern{kDefaultPattern};
    bool include_checksums = false;
};

// ── Retention ─────────────────────────────────────────────────────────────────
//
// At least one criterion must be set.  When both are, max_age_days wins and
// max_count is ignored.

// Upper bound for max_age_days (100 years); keeps the cutoff representable.
inline constexpr double kMaxRetentionDays = 36500.0;

struct RetentionPolicy {
    std::optional<double> max_age_days;     // (0, kMaxRetentionDays]
    std::optional<std::size_t> max_count;
    std::string pattern{kDefaultPattern};
};

struct RetentionResult {
    bool success = true;                    // false only if the catalog was unreadable
    std::size_t removed = 0;
    std::vector<std::string> removed_files;
    std::vector<std::string> errors;        // one entry per file that could not be removed
    std::size_t total_files = 0;
    std::size_t remaining_files = 0;
};

// ── Restore ───────────────────────────────────────────────────────────────────

struct RestoreRequest {
    std::filesystem::path target_path;      // empty: the configured database
    bool verify_before_restore          = true;
    bool snapshot_current_before_restore = true;
};

struct RestoreCompleted {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::optional<std::filesystem::path> pre_restore_snapshot;
    std::string timestamp;
};

using RestoreResult = std::variant<RestoreCompleted, OperationFailure>;

// ── Helpers ───────────────────────────────────────────────────────────────────

template <typename Result>
[[nodiscard]] bool succeeded(const Result& result) {
    return !std::holds_alternative<OperationFailure>(result);
}

} // namespace dbsnap::backup
