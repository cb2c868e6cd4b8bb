#include "backup/backup_manager.hpp"
#include "backup/integrity_verifier.hpp"
#include "cli/cli_options.hpp"
#include "common/errors.hpp"
#include "common/format.hpp"
#include "common/logger.hpp"
#include "engine/sqlite_engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace {

using namespace dbsnap;
using namespace dbsnap::backup;

// Manager for `database` honouring --backup-dir.
BackupManager make_manager(const std::string& database, const cli::CliOptions& opts) {
    ManagerConfig cfg;
    cfg.database_path = database;
    if (opts.backup_dir) {
        cfg.snapshot_directory = *opts.backup_dir;
    }
    return BackupManager{std::move(cfg)};
}

std::string filename_of(const std::string& path) {
    return std::filesystem::path{path}.filename().string();
}

// ── Commands ──────────────────────────────────────────────────────────────────

int run_create(const cli::CliOptions& opts) {
    const auto& database = opts.args[0];
    fprintf(stdout, "Creating backup for: %s\n",
            opts.verbose ? database.c_str() : filename_of(database).c_str());

    auto manager = make_manager(database, opts);

    SnapshotRequest request;
    request.filename            = opts.filename;
    request.include_timestamp   = opts.include_timestamp;
    request.verify_after_create = opts.verify;
    request.strategy            = opts.strategy;

    const auto result = manager.create_backup(request);
    if (const auto* failed = std::get_if<OperationFailure>(&result)) {
        fprintf(stderr, "Backup failed: %s\n", failed->message.c_str());
        return 1;
    }

    const auto& created = std::get<SnapshotCreated>(result);
    fprintf(stdout, "Backup created successfully!\n");
    fprintf(stdout, "  Location: %s\n", created.path.c_str());
    fprintf(stdout, "  Size:     %s\n", format_size(created.size).c_str());
    fprintf(stdout, "  Duration: %s\n", format_duration(created.duration).c_str());
    if (created.checksum) {
        fprintf(stdout, "  Checksum: %s\n", created.checksum->c_str());
    }
    return 0;
}

int run_list(const cli::CliOptions& opts) {
    const auto& database = opts.args[0];
    fprintf(stdout, "Listing backups for: %s\n", filename_of(database).c_str());

    auto manager = make_manager(database, opts);

    ListRequest request;
    request.include_checksums = opts.include_checksums;
    const auto backups = manager.list_backups(request);

    if (backups.empty()) {
        fprintf(stdout, "No backups found\n");
        return 0;
    }

    fprintf(stdout, "\nFound %zu backup(s):\n\n", backups.size());
    std::size_t index = 0;
    for (const auto& info : backups) {
        fprintf(stdout, "%zu. %s\n", ++index, info.filename.c_str());
        fprintf(stdout, "   Path:    %s\n", info.path.c_str());
        fprintf(stdout, "   Size:    %s\n", format_size(info.size).c_str());
        fprintf(stdout, "   Created: %s\n", iso8601_utc(info.created).c_str());
        if (opts.include_checksums) {
            fprintf(stdout, "   Checksum: %s\n",
                    info.checksum ? info.checksum->c_str() : "N/A");
            fprintf(stdout, "   Valid:    %s\n",
                    !info.valid ? "Unknown" : (*info.valid ? "Yes" : "No"));
        }
        fprintf(stdout, "\n");
    }
    return 0;
}

int run_cleanup(const cli::CliOptions& opts) {
    const auto& database = opts.args[0];

    RetentionPolicy policy;
    policy.max_age_days = opts.retention_days;
    policy.max_count    = opts.max_backups;

    if (policy.max_age_days) {
        fprintf(stdout, "Cleaning up backups older than %g days for: %s\n",
                *policy.max_age_days, filename_of(database).c_str());
    } else {
        fprintf(stdout, "Cleaning up backups keeping only %zu most recent for: %s\n",
                *policy.max_count, filename_of(database).c_str());
    }

    auto manager = make_manager(database, opts);
    const auto result = manager.cleanup(policy);

    if (!result.success) {
        fprintf(stderr, "Cleanup failed: %s\n",
                result.errors.empty() ? "unknown error" : result.errors.front().c_str());
        return 1;
    }

    if (result.removed > 0) {
        fprintf(stdout, "Removed %zu old backup(s)\n", result.removed);
        if (opts.verbose) {
            fprintf(stdout, "Removed files:\n");
            for (const auto& name : result.removed_files) {
                fprintf(stdout, "   - %s\n", name.c_str());
            }
        }
    } else {
        fprintf(stdout, "No old backups to remove\n");
    }
    fprintf(stdout, "Total backups: %zu, Remaining: %zu\n",
            result.total_files, result.remaining_files);

    if (!result.errors.empty()) {
        fprintf(stderr, "Some errors occurred:\n");
        for (const auto& error : result.errors) {
            fprintf(stderr, "   %s\n", error.c_str());
        }
    }
    return 0;
}

int run_restore(const cli::CliOptions& opts) {
    const auto& backup_path = opts.args[0];
    const auto& database    = opts.args[1];
    const std::string target = opts.target.value_or(database);

    fprintf(stdout, "Restoring backup: %s\n", filename_of(backup_path).c_str());
    fprintf(stdout, "Target: %s\n", target.c_str());

    auto manager = make_manager(database, opts);

    RestoreRequest request;
    request.target_path                    = target;
    request.verify_before_restore          = opts.verify;
    request.snapshot_current_before_restore = true;

    const auto result = manager.restore(backup_path, request);
    if (const auto* failed = std::get_if<OperationFailure>(&result)) {
        fprintf(stderr, "Restore failed: %s\n", failed->message.c_str());
        return 1;
    }

    const auto& done = std::get<RestoreCompleted>(result);
    fprintf(stdout, "Restore completed successfully!\n");
    fprintf(stdout, "  Restored to: %s\n", done.destination.c_str());
    if (done.pre_restore_snapshot) {
        fprintf(stdout, "  Pre-restore backup: %s\n", done.pre_restore_snapshot->c_str());
    }
    return 0;
}

int run_verify(const cli::CliOptions& opts) {
    const std::filesystem::path backup_path{opts.args[0]};
    fprintf(stdout, "Verifying backup: %s\n", backup_path.filename().c_str());

    engine::SqliteEngine engine;
    const IntegrityVerifier verifier{engine};

    if (!verifier.verify(backup_path)) {
        fprintf(stderr, "Backup is corrupted or invalid\n");
        return 1;
    }
    fprintf(stdout, "Backup is valid\n");

    if (opts.verbose) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(backup_path, ec);
        if (!ec) {
            fprintf(stdout, "  Size: %s\n", format_size(size).c_str());
        }
        const auto mtime = std::filesystem::last_write_time(backup_path, ec);
        if (!ec) {
            const auto sys = std::chrono::file_clock::to_sys(mtime);
            fprintf(stdout, "  Modified: %s\n",
                    iso8601_utc(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys))
                        .c_str());
        }
    }
    return 0;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    cli::CliOptions opts;
    try {
        opts = cli::parse_cli(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        fprintf(stderr, "Run 'dbsnap help' for usage.\n");
        return 1;
    }

    if (opts.show_help) {
        fprintf(stdout, "%s", cli::help_text().c_str());
        return 0;
    }

    init_default_logger(opts.verbose ? spdlog::level::debug : parse_log_level(opts.log_level));

    if (opts.verbose) {
        fprintf(stdout, "Options: %s\n", cli::describe(opts).c_str());
    }

    try {
        if (opts.command == "create")  return run_create(opts);
        if (opts.command == "list")    return run_list(opts);
        if (opts.command == "cleanup") return run_cleanup(opts);
        if (opts.command == "restore") return run_restore(opts);
        if (opts.command == "verify")  return run_verify(opts);
    } catch (const ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Command failed: %s\n", e.what());
        return 1;
    }

    fprintf(stderr, "Unknown command: %s\n", opts.command.c_str());
    return 1;
}
