#include "backup/retention.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

[[nodiscard]] bool newer_first(const SnapshotInfo& a, const SnapshotInfo& b) {
    if (a.modified != b.modified) {
        return a.modified > b.modified;
    }
    return a.filename > b.filename;
}

[[nodiscard]] TimePoint age_cutoff(TimePoint now, double max_age_days) {
    using namespace std::chrono;
    const duration<double, std::ratio<86400>> age{max_age_days};
    return now - duration_cast<system_clock::duration>(age);
}

} // anonymous namespace

// ── validate_policy ──────────────────────────────────────────────────────────

void validate_policy(const RetentionPolicy& policy) {
    if (!policy.max_age_days && !policy.max_count) {
        throw ConfigError("Either max_age_days or max_count must be specified");
    }
    if (policy.max_age_days) {
        const double days = *policy.max_age_days;
        if (!std::isfinite(days) || days <= 0.0 || days > kMaxRetentionDays) {
            throw ConfigError(fmt::format(
                "max_age_days must be a positive number of at most {}, got {}",
                kMaxRetentionDays, days));
        }
    }
}

// ── select_for_removal ───────────────────────────────────────────────────────

std::vector<SnapshotInfo> select_for_removal(const RetentionPolicy& policy,
                                             const std::vector<SnapshotInfo>& entries,
                                             TimePoint now) {
    validate_policy(policy);

    std::vector<SnapshotInfo> sorted = entries;
    std::sort(sorted.begin(), sorted.end(), newer_first);

    std::vector<SnapshotInfo> selected;

    if (policy.max_age_days) {
        if (policy.max_count) {
            spdlog::debug("retention: both criteria set, max_count={} ignored",
                          *policy.max_count);
        }
        const auto cutoff = age_cutoff(now, *policy.max_age_days);
        std::copy_if(sorted.begin(), sorted.end(), std::back_inserter(selected),
                     [cutoff](const SnapshotInfo& e) { return e.modified < cutoff; });
        return selected;
    }

    const auto keep = std::min(*policy.max_count, sorted.size());
    selected.assign(sorted.begin() + static_cast<std::ptrdiff_t>(keep), sorted.end());
    return selected;
}

// ── apply_retention ──────────────────────────────────────────────────────────

RetentionResult apply_retention(const RetentionPolicy& policy,
                                const std::vector<SnapshotInfo>& entries,
                                TimePoint now) {
    const auto selected = select_for_removal(policy, entries, now);

    RetentionResult result;
    result.total_files = entries.size();

    for (const auto& entry : selected) {
        std::error_code ec;
        const bool existed = std::filesystem::remove(entry.path, ec);
        if (!ec && !existed) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        if (ec) {
            spdlog::warn("retention: failed to remove {}: {}", entry.path.string(),
                         ec.message());
            result.errors.push_back(
                fmt::format("Failed to remove {}: {}", entry.filename, ec.message()));
            continue;
        }
        result.removed_files.push_back(entry.filename);
    }

    result.removed         = result.removed_files.size();
    result.remaining_files = result.total_files - result.removed;

    spdlog::info("retention: removed {} of {} snapshot(s), {} error(s)",
                 result.removed, result.total_files, result.errors.size());
    return result;
}

} // namespace dbsnap::backup
