#include "backup/snapshot_producer.hpp"
#include "common/errors.hpp"
#include "common/format.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

[[nodiscard]] bool ends_with_extension(std::string_view name) {
    return name.size() >= kSnapshotExtension.size() &&
           name.substr(name.size() - kSnapshotExtension.size()) == kSnapshotExtension;
}

} // anonymous namespace

SnapshotProducer::SnapshotProducer(engine::DatabaseEngine& engine)
    : engine_{engine}
{}

// ── produce ──────────────────────────────────────────────────────────────────

std::error_code SnapshotProducer::produce(SnapshotStrategy strategy,
                                          const std::filesystem::path& source,
                                          const std::filesystem::path& target) {
    auto tmp_path = target;
    tmp_path += ".tmp";

    // A leftover from an interrupted run would make VACUUM INTO refuse and
    // the backup API append to stale pages.
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    if (ec) {
        spdlog::error("SnapshotProducer: cannot clear stale {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    ec = copy_into(strategy, source, tmp_path);
    if (ec) {
        spdlog::error("SnapshotProducer: {} of {} failed: {}",
                      to_string(strategy), source.string(), ec.message());
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        return ec;
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        spdlog::error("SnapshotProducer: rename {} -> {} failed: {}",
                      tmp_path.string(), target.string(), ec.message());
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        return ec;
    }

    spdlog::debug("SnapshotProducer: {} {} -> {}", to_string(strategy),
                  source.string(), target.string());
    return {};
}

std::error_code SnapshotProducer::copy_into(SnapshotStrategy strategy,
                                            const std::filesystem::path& source,
                                            const std::filesystem::path& tmp) {
    switch (strategy) {
        case SnapshotStrategy::NativeCopy:
            return engine_.hot_copy(source, tmp);

        case SnapshotStrategy::CompactCopy:
            return engine_.compact_copy(source, tmp);

        case SnapshotStrategy::RawCopy: {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(source, ec)) {
                return ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
            }
            std::filesystem::copy_file(source, tmp,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            return ec;
        }
    }
    return make_error_code(BackupErrc::unknown_strategy);
}

// ── snapshot_filename ────────────────────────────────────────────────────────

std::string snapshot_filename(const std::filesystem::path& database_path,
                              const SnapshotRequest& request,
                              TimePoint now) {
    if (request.filename && !request.filename->empty()) {
        if (ends_with_extension(*request.filename)) {
            return *request.filename;
        }
        return *request.filename + std::string{kSnapshotExtension};
    }

    std::string base = database_path.filename().string();
    if (ends_with_extension(base)) {
        base.resize(base.size() - kSnapshotExtension.size());
    }

    std::string name = base + "-backup";
    if (request.include_timestamp) {
        std::string stamp = iso8601_utc(now);
        std::replace_if(stamp.begin(), stamp.end(),
                        [](char c) { return c == ':' || c == '.'; }, '-');
        name += '-';
        name += stamp;
    }
    name += kSnapshotExtension;
    return name;
}

} // namespace dbsnap::backup
