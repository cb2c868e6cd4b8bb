#include "backup/backup_manager.hpp"
#include "backup/checksum.hpp"
#include "backup/retention.hpp"
#include "common/errors.hpp"
#include "common/format.hpp"
#include "engine/sqlite_engine.hpp"

#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

// Fill defaults, make paths absolute, check the database exists and create
// the snapshot directory if asked to.  Throws ConfigError.
[[nodiscard]] ManagerConfig resolve_config(ManagerConfig config) {
    if (config.database_path.empty()) {
        throw ConfigError("Database path is required");
    }

    std::error_code ec;
    config.database_path = std::filesystem::absolute(config.database_path, ec).lexically_normal();
    if (ec) {
        throw ConfigError(fmt::format("Cannot resolve database path: {}", ec.message()));
    }
    if (!std::filesystem::is_regular_file(config.database_path, ec)) {
        throw ConfigError(fmt::format("Database file not found: {}",
                                      config.database_path.string()));
    }

    if (config.snapshot_directory.empty()) {
        config.snapshot_directory = config.database_path.parent_path() / "backups";
    } else {
        config.snapshot_directory =
            std::filesystem::absolute(config.snapshot_directory, ec).lexically_normal();
        if (ec) {
            throw ConfigError(fmt::format("Cannot resolve backup directory: {}", ec.message()));
        }
    }

    if (config.auto_create_directory &&
        !std::filesystem::is_directory(config.snapshot_directory, ec)) {
        std::filesystem::create_directories(config.snapshot_directory, ec);
        if (ec) {
            throw ConfigError(fmt::format("Cannot create backup directory {}: {}",
                                          config.snapshot_directory.string(), ec.message()));
        }
        spdlog::debug("BackupManager: created {}", config.snapshot_directory.string());
    }

    return config;
}

} // anonymous namespace

BackupManager::BackupManager(ManagerConfig config,
                             std::shared_ptr<engine::DatabaseEngine> engine,
                             std::shared_ptr<const Clock> clock)
    : config_{resolve_config(std::move(config))}
    , engine_{engine ? std::move(engine) : std::make_shared<engine::SqliteEngine>()}
    , clock_{clock ? std::move(clock) : std::make_shared<SystemClock>()}
    , verifier_{*engine_}
    , producer_{*engine_}
    , catalog_{verifier_}
    , restorer_{verifier_,
                [this](const std::filesystem::path& source, const SnapshotRequest& request) {
                    return snapshot_file(source, request);
                },
                *clock_}
{
    spdlog::debug("BackupManager: database={} backups={}",
                  config_.database_path.string(), config_.snapshot_directory.string());
}

OperationFailure BackupManager::failure(std::error_code ec, std::string message) const {
    spdlog::error("BackupManager: {}", message);
    return {ec, std::move(message), iso8601_utc(clock_->now())};
}

// ── create_backup ────────────────────────────────────────────────────────────

SnapshotResult BackupManager::create_backup(const SnapshotRequest& request) {
    return snapshot_file(config_.database_path, request);
}

SnapshotResult BackupManager::snapshot_file(const std::filesystem::path& source,
                                            const SnapshotRequest& request) {
    const auto started = std::chrono::steady_clock::now();

    const auto filename = snapshot_filename(source, request, clock_->now());
    const auto path     = config_.snapshot_directory / filename;

    if (auto ec = producer_.produce(request.strategy, source, path)) {
        return failure(ec, fmt::format("Backup of {} failed: {}", source.string(), ec.message()));
    }

    if (request.verify_after_create && !verifier_.verify(path)) {
        std::error_code rm_ec;
        std::filesystem::remove(path, rm_ec);
        if (rm_ec) {
            spdlog::warn("BackupManager: cannot remove bad snapshot {}: {}",
                         path.string(), rm_ec.message());
        }
        return failure(BackupErrc::integrity_check_failed,
                       fmt::format("Backup failed integrity check: {}", filename));
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return failure(ec, fmt::format("Cannot stat backup {}: {}", path.string(), ec.message()));
    }

    SnapshotCreated created;
    created.path     = path;
    created.filename = filename;
    created.size     = size;
    created.checksum = file_checksum(path);
    created.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    created.timestamp = iso8601_utc(clock_->now());
    created.strategy  = request.strategy;

    spdlog::info("BackupManager: created {} ({}, {}, {})", filename, to_string(request.strategy),
                 format_size(size), format_duration(created.duration));
    return created;
}

// ── verify_backup ────────────────────────────────────────────────────────────

bool BackupManager::verify_backup(const std::filesystem::path& path) const {
    return verifier_.verify(path);
}

// ── list_backups ─────────────────────────────────────────────────────────────

std::vector<SnapshotInfo> BackupManager::list_backups(const ListRequest& request) const {
    return catalog_.list(config_.snapshot_directory, request.pattern, request.include_checksums);
}

// ── cleanup ──────────────────────────────────────────────────────────────────

RetentionResult BackupManager::cleanup(const RetentionPolicy& policy) {
    validate_policy(policy);

    std::vector<SnapshotInfo> entries;
    try {
        entries = catalog_.list(config_.snapshot_directory, policy.pattern, false);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("BackupManager: cleanup cannot read {}: {}",
                      config_.snapshot_directory.string(), e.what());
        RetentionResult result;
        result.success = false;
        result.errors.emplace_back(e.what());
        return result;
    }

    return apply_retention(policy, entries, clock_->now());
}

// ── restore ──────────────────────────────────────────────────────────────────

RestoreResult BackupManager::restore(const std::filesystem::path& snapshot_path,
                                     const RestoreRequest& request) {
    std::error_code ec;
    const auto source = std::filesystem::absolute(snapshot_path, ec);
    if (ec) {
        return failure(ec, fmt::format("Cannot resolve backup path: {}", ec.message()));
    }

    auto target = config_.database_path;
    if (!request.target_path.empty()) {
        target = std::filesystem::absolute(request.target_path, ec);
        if (ec) {
            return failure(ec, fmt::format("Cannot resolve restore target: {}", ec.message()));
        }
    }

    return restorer_.restore(source, target, request);
}

} // namespace dbsnap::backup
