#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace dbsnap::engine {

// ── DatabaseEngine ───────────────────────────────────────────────────────────
//
// The three capabilities the backup manager needs from the database engine.
// The production backend talks to SQLite directly (SqliteEngine); tests
// substitute fakes to drive failure paths.
//
// Implementations hold no per-call state and may be shared between managers.

class DatabaseEngine {
public:
    virtual ~DatabaseEngine() = default;

    // Produce a transactionally consistent copy of `source` at `target`, even
    // while another connection is writing to `source`.  `target` is created or
    // overwritten.
    [[nodiscard]] virtual std::error_code hot_copy(const std::filesystem::path& source,
                                                   const std::filesystem::path& target) = 0;

    // Like hot_copy(), but rewrites the database without free pages.
    // `target` must not exist.
    [[nodiscard]] virtual std::error_code compact_copy(const std::filesystem::path& source,
                                                       const std::filesystem::path& target) = 0;

    // Run the engine's consistency check on `path` and return its output rows
    // (a healthy database yields exactly {"ok"}).  std::nullopt means the check
    // could not be run at all (cannot open, not a database, I/O error).
    [[nodiscard]] virtual std::optional<std::vector<std::string>> integrity_check(
        const std::filesystem::path& path) = 0;
};

} // namespace dbsnap::engine
