#pragma once

#include "backup/types.hpp"
#include "engine/database_engine.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace dbsnap::backup {

// ── SnapshotProducer ──────────────────────────────────────────────────────────
//
// Writes one snapshot of `source` to `target` using the chosen strategy.
//
// Every strategy writes into "<target>.tmp" and renames it over `target` only
// once the copy is complete, so `target` is either absent, the previous file,
// or the finished snapshot.  The temporary file is removed on failure.
//
// RawCopy gives no consistency guarantee if another process is writing to
// `source`; keeping the source quiescent is the caller's job.

class SnapshotProducer {
public:
    explicit SnapshotProducer(engine::DatabaseEngine& engine);

    [[nodiscard]] std::error_code produce(SnapshotStrategy strategy,
                                          const std::filesystem::path& source,
                                          const std::filesystem::path& target);

private:
    [[nodiscard]] std::error_code copy_into(SnapshotStrategy strategy,
                                            const std::filesystem::path& source,
                                            const std::filesystem::path& tmp);

    engine::DatabaseEngine& engine_;
};

// Snapshot filename for `request` against `database_path` at instant `now`.
//
//   custom filename   → used as-is, ".db" appended if missing
//   generated         → "<basename>-backup[-<timestamp>].db", where basename
//                       drops a trailing ".db" and the timestamp is the
//                       ISO-8601 instant with ':' and '.' replaced by '-'
[[nodiscard]] std::string snapshot_filename(const std::filesystem::path& database_path,
                                            const SnapshotRequest& request,
                                            TimePoint now);

} // namespace dbsnap::backup
