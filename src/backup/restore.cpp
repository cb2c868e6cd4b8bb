#include "backup/restore.hpp"
#include "common/errors.hpp"
#include "common/format.hpp"

#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

// Journal sidecars that would be replayed on top of the restored file.
constexpr const char* kSidecarSuffixes[] = {"-wal", "-shm"};

[[nodiscard]] std::error_code remove_sidecars(const std::filesystem::path& target) {
    for (const char* suffix : kSidecarSuffixes) {
        auto sidecar = target;
        sidecar += suffix;
        std::error_code ec;
        if (std::filesystem::remove(sidecar, ec)) {
            spdlog::debug("restore: removed stale {}", sidecar.string());
        }
        if (ec) {
            return ec;
        }
    }
    return {};
}

void discard(const std::filesystem::path& tmp) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    if (ec) {
        spdlog::warn("restore: cannot remove {}: {}", tmp.string(), ec.message());
    }
}

} // anonymous namespace

RestoreOrchestrator::RestoreOrchestrator(const IntegrityVerifier& verifier,
                                         SnapshotFn take_snapshot,
                                         const Clock& clock)
    : verifier_{verifier}
    , take_snapshot_{std::move(take_snapshot)}
    , clock_{clock}
{}

OperationFailure RestoreOrchestrator::failure(std::error_code ec, std::string message) const {
    spdlog::error("restore: {}", message);
    return {ec, std::move(message), iso8601_utc(clock_.now())};
}

RestoreResult RestoreOrchestrator::restore(const std::filesystem::path& snapshot_path,
                                           const std::filesystem::path& target_path,
                                           const RestoreRequest& request) const {
    // Step 1: refuse a known-bad snapshot before touching anything.
    if (request.verify_before_restore && !verifier_.verify(snapshot_path)) {
        return failure(BackupErrc::integrity_check_failed,
                       fmt::format("Backup file failed integrity check: {}",
                                   snapshot_path.string()));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(snapshot_path, ec)) {
        return failure(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                       fmt::format("Backup file not found: {}", snapshot_path.string()));
    }

    // Step 2: safety copy of whatever is about to be overwritten.
    std::optional<std::filesystem::path> pre_restore;
    if (request.snapshot_current_before_restore &&
        std::filesystem::exists(target_path, ec)) {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_.now().time_since_epoch()).count();

        SnapshotRequest safety;
        safety.filename          = fmt::format("pre-restore-backup-{}.db", millis);
        safety.include_timestamp = false;

        auto result = take_snapshot_(target_path, safety);
        if (auto* failed = std::get_if<OperationFailure>(&result)) {
            return failure(BackupErrc::pre_restore_snapshot_failed,
                           fmt::format("Failed to create pre-restore backup: {}",
                                       failed->message));
        }
        pre_restore = std::get<SnapshotCreated>(result).path;
        spdlog::info("restore: pre-restore snapshot {}", pre_restore->string());
    }

    // Step 3: reinstate.  The snapshot is staged next to the target and
    // renamed over it, so a failed copy leaves the target and its journal
    // files as they were.
    auto tmp_path = target_path;
    tmp_path += ".tmp";
    std::filesystem::remove(tmp_path, ec);
    if (ec) {
        return failure(ec, fmt::format("Cannot clear stale {}: {}", tmp_path.string(),
                                       ec.message()));
    }

    std::filesystem::copy_file(snapshot_path, tmp_path, ec);
    if (ec) {
        discard(tmp_path);
        return failure(ec, fmt::format("Cannot copy {} to {}: {}", snapshot_path.string(),
                                       tmp_path.string(), ec.message()));
    }
    if (auto sidecar_ec = remove_sidecars(target_path)) {
        discard(tmp_path);
        return failure(sidecar_ec,
                       fmt::format("Cannot remove journal files of {}: {}",
                                   target_path.string(), sidecar_ec.message()));
    }
    std::filesystem::rename(tmp_path, target_path, ec);
    if (ec) {
        discard(tmp_path);
        return failure(ec, fmt::format("Cannot move {} over {}: {}", tmp_path.string(),
                                       target_path.string(), ec.message()));
    }

    // Step 4: the written file must pass on its own.
    if (!verifier_.verify(target_path)) {
        std::string message = fmt::format("Restored database failed integrity check: {}",
                                          target_path.string());
        if (pre_restore) {
            message += fmt::format(" (previous state kept in {})", pre_restore->string());
        }
        return failure(BackupErrc::integrity_check_failed, std::move(message));
    }

    spdlog::info("restore: {} -> {}", snapshot_path.string(), target_path.string());
    return RestoreCompleted{
        .source               = snapshot_path,
        .destination          = target_path,
        .pre_restore_snapshot = pre_restore,
        .timestamp            = iso8601_utc(clock_.now()),
    };
}

} // namespace dbsnap::backup
