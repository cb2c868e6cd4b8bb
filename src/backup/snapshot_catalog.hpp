#pragma once

#include "backup/integrity_verifier.hpp"
#include "backup/types.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace dbsnap::backup {

// Restricted glob: "*" and "*.*" match everything, "*.<ext>" matches names
// ending in ".<ext>", anything else must equal the filename exactly.
[[nodiscard]] bool matches_pattern(std::string_view filename, std::string_view pattern);

// ── SnapshotCatalog ───────────────────────────────────────────────────────────
//
// Read path over a snapshot directory.  Every call re-reads the directory;
// nothing is cached.
//
// Only regular files are listed.  An entry that disappears between readdir()
// and stat() (a concurrent cleanup) is skipped.  Entries come back newest
// first by creation time, ties broken by filename (descending) so the order is
// reproducible.
//
// Creation time is the filesystem birth time where the filesystem records one,
// otherwise the modification time.

class SnapshotCatalog {
public:
    explicit SnapshotCatalog(const IntegrityVerifier& verifier);

    // A non-existent directory yields an empty vector.  An unreadable one
    // throws std::filesystem::filesystem_error.
    //
    // With `include_checksums`, each entry's checksum and validity are
    // computed serially, in catalog order.
    [[nodiscard]] std::vector<SnapshotInfo> list(const std::filesystem::path& directory,
                                                 std::string_view pattern,
                                                 bool include_checksums) const;

private:
    const IntegrityVerifier& verifier_;
};

} // namespace dbsnap::backup
