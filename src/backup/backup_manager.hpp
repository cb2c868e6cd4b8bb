#pragma once

#include "backup/integrity_verifier.hpp"
#include "backup/restore.hpp"
#include "backup/snapshot_catalog.hpp"
#include "backup/snapshot_producer.hpp"
#include "backup/types.hpp"
#include "common/clock.hpp"
#include "engine/database_engine.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace dbsnap::backup {

// ── BackupManager ────────────────────────────────────────────────────────────
//
// Lifecycle operations for the snapshots of one database file: create,
// verify, list, cleanup, restore.
//
// Construction validates the configuration and throws ConfigError on bad
// input; a manager that was constructed is usable.  Afterwards only
// cleanup() throws (ConfigError, for a policy without criteria).  Everything
// else reports failure through its return value.
//
// No state is kept between calls besides the configuration: every operation
// re-reads the filesystem.  Not internally synchronised; do not share one
// instance between threads.  No filesystem locks are taken either, so callers
// that run several managers against one directory must serialise externally.

class BackupManager {
public:
    // `engine` defaults to SqliteEngine, `clock` to SystemClock.
    explicit BackupManager(ManagerConfig config,
                           std::shared_ptr<engine::DatabaseEngine> engine = nullptr,
                           std::shared_ptr<const Clock> clock = nullptr);

    // Not copyable or movable – components hold references to each other.
    BackupManager(const BackupManager&)            = delete;
    BackupManager& operator=(const BackupManager&) = delete;
    BackupManager(BackupManager&&)                 = delete;
    BackupManager& operator=(BackupManager&&)      = delete;

    [[nodiscard]] const ManagerConfig& config() const { return config_; }

    // Snapshot the configured database into the snapshot directory.
    // A snapshot that fails verify_after_create is deleted before returning.
    [[nodiscard]] SnapshotResult create_backup(const SnapshotRequest& request = {});

    // Fail-closed integrity check of any database file.
    [[nodiscard]] bool verify_backup(const std::filesystem::path& path) const;

    // Snapshot files in the snapshot directory, newest first.
    // Throws std::filesystem::filesystem_error if the directory is unreadable.
    [[nodiscard]] std::vector<SnapshotInfo> list_backups(const ListRequest& request = {}) const;

    // Apply `policy` to the snapshot directory.
    // Throws ConfigError before touching any file if the policy is invalid.
    [[nodiscard]] RetentionResult cleanup(const RetentionPolicy& policy);

    // Reinstate `snapshot_path` over request.target_path (default: the
    // configured database).
    [[nodiscard]] RestoreResult restore(const std::filesystem::path& snapshot_path,
                                        const RestoreRequest& request = {});

private:
    // Snapshot `source` into the snapshot directory.  Shared by create_backup()
    // and the pre-restore safety copy.
    [[nodiscard]] SnapshotResult snapshot_file(const std::filesystem::path& source,
                                               const SnapshotRequest& request);

    [[nodiscard]] OperationFailure failure(std::error_code ec, std::string message) const;

    ManagerConfig config_;
    std::shared_ptr<engine::DatabaseEngine> engine_;
    std::shared_ptr<const Clock> clock_;
    IntegrityVerifier verifier_;
    SnapshotProducer producer_;
    SnapshotCatalog catalog_;
    RestoreOrchestrator restorer_;
};

} // namespace dbsnap::backup
