#pragma once

#include "backup/integrity_verifier.hpp"
#include "backup/types.hpp"
#include "common/clock.hpp"

#include <filesystem>
#include <functional>

namespace dbsnap::backup {

// ── RestoreOrchestrator ──────────────────────────────────────────────────────
//
// Reinstates a snapshot over a live database file.  One linear sequence per
// call:
//
//   1. verify the snapshot (optional); a bad snapshot aborts before any write
//   2. take a pre-restore safety copy of the current target (optional, only if
//      the target exists); failure aborts before any write
//   3. copy the snapshot to "<target>.tmp", drop stale "-wal"/"-shm" sidecars
//      of the target and rename the copy over it; a failed copy leaves the
//      target untouched
//   4. verify the target; failure is reported even though the copy succeeded
//
// There is no rollback after step 3.  When step 4 fails the failure message
// names the pre-restore copy, if one was taken.

class RestoreOrchestrator {
public:
    // Takes a NativeCopy snapshot of the given live file into the snapshot
    // directory under the given request.
    using SnapshotFn =
        std::function<SnapshotResult(const std::filesystem::path&, const SnapshotRequest&)>;

    RestoreOrchestrator(const IntegrityVerifier& verifier,
                        SnapshotFn take_snapshot,
                        const Clock& clock);

    [[nodiscard]] RestoreResult restore(const std::filesystem::path& snapshot_path,
                                        const std::filesystem::path& target_path,
                                        const RestoreRequest& request) const;

private:
    [[nodiscard]] OperationFailure failure(std::error_code ec, std::string message) const;

    const IntegrityVerifier& verifier_;
    SnapshotFn take_snapshot_;
    const Clock& clock_;
};

} // namespace dbsnap::backup
