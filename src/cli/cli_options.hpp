#pragma once

#include "backup/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace dbsnap::cli {

// ── CliOptions ────────────────────────────────────────────────────────────────
// Everything the dbsnap command line can express.
// Populated by parse_cli().

struct CliOptions {
    std::string command;                        // create|list|cleanup|restore|verify|help
    std::vector<std::string> args;              // positional arguments after the command

    std::optional<std::string> backup_dir;      // --backup-dir
    std::optional<std::string> filename;        // --filename
    bool include_timestamp = true;              // cleared by --no-timestamp
    bool verify            = true;              // cleared by --no-verify
    backup::SnapshotStrategy strategy = backup::SnapshotStrategy::NativeCopy;  // --method
    std::optional<double> retention_days;       // --retention-days
    std::optional<std::size_t> max_backups;     // --max-backups
    std::optional<std::string> target;          // --target
    bool include_checksums = false;             // --include-checksums
    bool verbose           = false;             // --verbose
    std::string log_level  = "warn";            // --log-level

    bool show_help = false;                     // --help, -h or the "help" command
};

// ── parse_cli ─────────────────────────────────────────────────────────────────
// Parse argv into CliOptions.
//
// On success: returns validated options.  When show_help is set, nothing else
//             is guaranteed to be filled in.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - the command is known
//   - the number of positional arguments matches the command
//       create|list|cleanup|verify  <one path>
//       restore                     <backup> <database>
//   - --method is backup|copy|vacuum
//   - --retention-days is a finite number in (0, kMaxRetentionDays]
//   - --max-backups is >= 0
//   - cleanup has --retention-days or --max-backups

[[nodiscard]] CliOptions parse_cli(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with the visible
// dbsnap options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Full usage text: commands, options, examples.
[[nodiscard]] std::string help_text();

// One-line rendering of the effective options, echoed in verbose mode.
[[nodiscard]] std::string describe(const CliOptions& options);

} // namespace dbsnap::cli
