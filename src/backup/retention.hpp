#pragma once

#include "backup/types.hpp"

#include <vector>

namespace dbsnap::backup {

// ── Retention policy engine ──────────────────────────────────────────────────
//
// Selection rules:
//   max_age_days – remove every entry modified strictly before
//                  now - max_age_days; an entry exactly at the cutoff stays
//   max_count    – keep the max_count most recently modified entries (ties
//                  broken by filename, descending), remove the rest;
//                  0 removes everything
//   both set     – max_age_days only
//
// Removal is best-effort: each selected file is deleted independently and a
// failure, including a file that is already gone, is recorded in
// RetentionResult::errors without stopping the batch.

// Throws ConfigError if neither criterion is set or max_age_days is not a
// finite number in (0, kMaxRetentionDays].
void validate_policy(const RetentionPolicy& policy);

// Entries of `entries` that `policy` removes at instant `now`, newest first.
// Calls validate_policy() first.
[[nodiscard]] std::vector<SnapshotInfo> select_for_removal(const RetentionPolicy& policy,
                                                           const std::vector<SnapshotInfo>& entries,
                                                           TimePoint now);

// select_for_removal() followed by deletion of every selected file.
[[nodiscard]] RetentionResult apply_retention(const RetentionPolicy& policy,
                                              const std::vector<SnapshotInfo>& entries,
                                              TimePoint now);

} // namespace dbsnap::backup
