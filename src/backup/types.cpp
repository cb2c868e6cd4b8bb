#include "backup/types.hpp"

namespace dbsnap::backup {

std::string_view to_string(SnapshotStrategy strategy) {
    switch (strategy) {
        case SnapshotStrategy::NativeCopy:  return "backup";
        case SnapshotStrategy::RawCopy:     return "copy";
        case SnapshotStrategy::CompactCopy: return "vacuum";
    }
    return "unknown";
}

std::optional<SnapshotStrategy> parse_strategy(std::string_view name) {
    if (name == "backup") return SnapshotStrategy::NativeCopy;
    if (name == "copy")   return SnapshotStrategy::RawCopy;
    if (name == "vacuum") return SnapshotStrategy::CompactCopy;
    return std::nullopt;
}

} // namespace dbsnap::backup
