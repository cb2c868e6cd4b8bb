#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dbsnap::backup {

// SHA-256 of the full content of `path` as 64 lowercase hex characters.
// Returns std::nullopt on any read or digest error; never throws.
[[nodiscard]] std::optional<std::string> file_checksum(const std::filesystem::path& path);

} // namespace dbsnap::backup
