#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace dbsnap {

// ── ConfigError ───────────────────────────────────────────────────────────────
//
// Invalid construction input (missing database file, uncreatable snapshot
// directory) or invalid operation input (retention policy with no criterion).
// Always thrown synchronously, before any filesystem mutation.

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── BackupErrc ────────────────────────────────────────────────────────────────
//
// Failure reasons that are not plain I/O errors.  I/O failures travel as
// std::error_code in the system or sqlite category; these cover the checks
// the manager itself performs.

enum class BackupErrc {
    integrity_check_failed = 1,
    pre_restore_snapshot_failed,
    unknown_strategy,
};

[[nodiscard]] const std::error_category& backup_category() noexcept;

[[nodiscard]] std::error_code make_error_code(BackupErrc e) noexcept;

} // namespace dbsnap

template <>
struct std::is_error_code_enum<dbsnap::BackupErrc> : std::true_type {};
