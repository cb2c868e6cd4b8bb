#include "backup/snapshot_catalog.hpp"
#include "backup/checksum.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <optional>

#include <fcntl.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

[[nodiscard]] TimePoint to_time_point(const struct statx_timestamp& ts) {
    using namespace std::chrono;
    return TimePoint{duration_cast<system_clock::duration>(
        seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec))};
}

// stat() one entry.  Returns nullopt for entries that are not regular files
// or vanished; throws for any other error.
[[nodiscard]] std::optional<SnapshotInfo> stat_entry(const std::filesystem::path& path) {
    struct statx stx{};
    const unsigned int mask = STATX_TYPE | STATX_SIZE | STATX_MTIME | STATX_BTIME;
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, mask, &stx) != 0) {
        const int err = errno;
        if (err == ENOENT) {
            spdlog::debug("SnapshotCatalog: {} vanished during listing", path.string());
            return std::nullopt;
        }
        throw std::filesystem::filesystem_error(
            "cannot stat snapshot", path, std::error_code{err, std::system_category()});
    }
    if (!S_ISREG(stx.stx_mode)) {
        return std::nullopt;
    }

    SnapshotInfo info;
    info.filename = path.filename().string();
    info.path     = path;
    info.size     = stx.stx_size;
    info.modified = to_time_point(stx.stx_mtime);
    info.created  = (stx.stx_mask & STATX_BTIME) ? to_time_point(stx.stx_btime)
                                                 : info.modified;
    return info;
}

} // anonymous namespace

// ── matches_pattern ──────────────────────────────────────────────────────────

bool matches_pattern(std::string_view filename, std::string_view pattern) {
    if (pattern == "*" || pattern == "*.*") {
        return true;
    }
    if (pattern.size() > 2 && pattern.substr(0, 2) == "*.") {
        const auto suffix = pattern.substr(1);  // ".<ext>"
        return filename.size() >= suffix.size() &&
               filename.substr(filename.size() - suffix.size()) == suffix;
    }
    return filename == pattern;
}

// ── SnapshotCatalog ──────────────────────────────────────────────────────────

SnapshotCatalog::SnapshotCatalog(const IntegrityVerifier& verifier)
    : verifier_{verifier}
{}

std::vector<SnapshotInfo> SnapshotCatalog::list(const std::filesystem::path& directory,
                                                std::string_view pattern,
                                                bool include_checksums) const {
    std::vector<SnapshotInfo> entries;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        spdlog::debug("SnapshotCatalog: {} does not exist", directory.string());
        return entries;
    }

    for (const auto& dirent : std::filesystem::directory_iterator(directory)) {
        const auto name = dirent.path().filename().string();
        if (!matches_pattern(name, pattern)) {
            continue;
        }
        if (auto info = stat_entry(dirent.path())) {
            entries.push_back(std::move(*info));
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const SnapshotInfo& a, const SnapshotInfo& b) {
                  if (a.created != b.created) {
                      return a.created > b.created;
                  }
                  return a.filename > b.filename;
              });

    if (include_checksums) {
        for (auto& entry : entries) {
            entry.checksum = file_checksum(entry.path);
            entry.valid    = verifier_.verify(entry.path);
        }
    }

    spdlog::debug("SnapshotCatalog: {} entr{} matching '{}' in {}", entries.size(),
                  entries.size() == 1 ? "y" : "ies", pattern, directory.string());
    return entries;
}

} // namespace dbsnap::backup
