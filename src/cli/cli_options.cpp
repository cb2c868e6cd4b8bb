#include "cli/cli_options.hpp"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace po = boost::program_options;

namespace dbsnap::cli {

namespace {

// Positional arguments each command expects.
[[nodiscard]] std::size_t expected_args(const std::string& command) {
    if (command == "restore") {
        return 2;
    }
    if (command == "create" || command == "list" || command == "cleanup" ||
        command == "verify") {
        return 1;
    }
    throw std::runtime_error(fmt::format("Unknown command: {}", command));
}

[[nodiscard]] const char* usage_for(const std::string& command) {
    if (command == "create")  return "dbsnap create <database>";
    if (command == "list")    return "dbsnap list <database>";
    if (command == "cleanup") return "dbsnap cleanup <database>";
    if (command == "restore") return "dbsnap restore <backup> <database>";
    return "dbsnap verify <backup>";
}

// Validate the fully populated CliOptions.
void validate(const CliOptions& opts) {
    const auto wanted = expected_args(opts.command);
    if (opts.args.size() != wanted) {
        throw std::runtime_error(fmt::format("Usage: {}", usage_for(opts.command)));
    }

    if (opts.retention_days) {
        const double days = *opts.retention_days;
        if (!std::isfinite(days) || days <= 0.0 || days > backup::kMaxRetentionDays) {
            throw std::runtime_error(fmt::format(
                "--retention-days must be a positive number of at most {}, got {}",
                backup::kMaxRetentionDays, days));
        }
    }

    if (opts.command == "cleanup" && !opts.retention_days && !opts.max_backups) {
        throw std::runtime_error("Either --retention-days or --max-backups must be specified");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("backup-dir",
            po::value<std::string>(),
            "Directory to store backups (default: <database-dir>/backups)")
        ("filename",
            po::value<std::string>(),
            "Custom filename for backup")
        ("no-timestamp",
            "Don't include timestamp in filename")
        ("no-verify",
            "Skip backup verification")
        ("method",
            po::value<std::string>()->default_value("backup"),
            "Backup method: backup, copy, vacuum")
        ("retention-days",
            po::value<double>(),
            "Number of days to keep backups for cleanup")
        ("max-backups",
            po::value<std::int64_t>(),
            "Maximum number of backups to keep")
        ("target",
            po::value<std::string>(),
            "Target path for restore")
        ("include-checksums",
            "Include checksums when listing backups")
        ("verbose",
            "Enable verbose output")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── help_text ─────────────────────────────────────────────────────────────────

std::string help_text() {
    po::options_description desc("Options");
    add_options(desc);

    std::ostringstream oss;
    oss << "dbsnap - SQLite backup tool\n"
           "\n"
           "Usage: dbsnap <command> [options]\n"
           "\n"
           "Commands:\n"
           "  create <database>              Create a backup of the specified database\n"
           "  list <database>                List all backups for the specified database\n"
           "  cleanup <database>             Clean up old backups\n"
           "  restore <backup> <database>    Restore a backup to a database\n"
           "  verify <backup>                Verify backup integrity\n"
           "  help                           Show this help message\n"
           "\n"
        << desc
        << "\n"
           "Examples:\n"
           "  dbsnap create ./data/app.db\n"
           "  dbsnap create ./data/app.db --backup-dir ./backups --filename custom-backup\n"
           "  dbsnap list ./data/app.db --include-checksums\n"
           "  dbsnap cleanup ./data/app.db --retention-days 30\n"
           "  dbsnap restore ./backups/backup.db ./data/app.db\n"
           "  dbsnap verify ./backups/backup.db\n";
    return oss.str();
}

// ── parse_cli ─────────────────────────────────────────────────────────────────

CliOptions parse_cli(int argc, char* argv[]) {
    po::options_description visible("dbsnap options");
    add_options(visible);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args",    po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliOptions opts;
    if (vm.count("command")) {
        opts.command = vm["command"].as<std::string>();
    }
    if (vm.count("help") || opts.command.empty() || opts.command == "help") {
        opts.show_help = true;
        return opts;
    }

    if (vm.count("args")) {
        opts.args = vm["args"].as<std::vector<std::string>>();
    }
    if (vm.count("backup-dir")) {
        opts.backup_dir = vm["backup-dir"].as<std::string>();
    }
    if (vm.count("filename")) {
        opts.filename = vm["filename"].as<std::string>();
    }
    if (vm.count("target")) {
        opts.target = vm["target"].as<std::string>();
    }
    if (vm.count("retention-days")) {
        opts.retention_days = vm["retention-days"].as<double>();
    }
    if (vm.count("max-backups")) {
        const auto max = vm["max-backups"].as<std::int64_t>();
        if (max < 0) {
            throw std::runtime_error(
                fmt::format("--max-backups must be >= 0, got {}", max));
        }
        opts.max_backups = static_cast<std::size_t>(max);
    }

    opts.include_timestamp = vm.count("no-timestamp") == 0;
    opts.verify            = vm.count("no-verify") == 0;
    opts.include_checksums = vm.count("include-checksums") > 0;
    opts.verbose           = vm.count("verbose") > 0;
    opts.log_level         = vm["log-level"].as<std::string>();

    const auto method = vm["method"].as<std::string>();
    const auto strategy = backup::parse_strategy(method);
    if (!strategy) {
        throw std::runtime_error(fmt::format(
            "--method must be 'backup', 'copy' or 'vacuum', got '{}'", method));
    }
    opts.strategy = *strategy;

    validate(opts);
    return opts;
}

// ── describe ──────────────────────────────────────────────────────────────────

std::string describe(const CliOptions& opts) {
    std::string out = fmt::format(
        "command={} args=[{}] method={} timestamp={} verify={} checksums={}",
        opts.command, fmt::join(opts.args, ", "), backup::to_string(opts.strategy),
        opts.include_timestamp, opts.verify, opts.include_checksums);
    if (opts.backup_dir)     out += fmt::format(" backup-dir={}", *opts.backup_dir);
    if (opts.filename)       out += fmt::format(" filename={}", *opts.filename);
    if (opts.retention_days) out += fmt::format(" retention-days={}", *opts.retention_days);
    if (opts.max_backups)    out += fmt::format(" max-backups={}", *opts.max_backups);
    if (opts.target)         out += fmt::format(" target={}", *opts.target);
    return out;
}

} // namespace dbsnap::cli
