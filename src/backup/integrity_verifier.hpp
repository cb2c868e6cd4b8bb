#pragma once

#include "engine/database_engine.hpp"

#include <filesystem>

namespace dbsnap::backup {

// ── IntegrityVerifier ─────────────────────────────────────────────────────────
//
// Fail-closed consistency check for any database file (live database,
// snapshot, restore target).  verify() never throws: a missing file, an empty
// or truncated file, a file without the SQLite header, an engine that cannot
// run the check, or any check output other than a single "ok" row all yield
// false.

class IntegrityVerifier {
public:
    // Size of the SQLite database header; shorter files cannot be databases.
    static constexpr std::size_t kHeaderSize = 100;

    explicit IntegrityVerifier(engine::DatabaseEngine& engine);

    [[nodiscard]] bool verify(const std::filesystem::path& path) const;

    // True if `path` is a regular file of at least kHeaderSize bytes starting
    // with the "SQLite format 3" magic.
    [[nodiscard]] static bool has_database_header(const std::filesystem::path& path);

private:
    engine::DatabaseEngine& engine_;
};

} // namespace dbsnap::backup
