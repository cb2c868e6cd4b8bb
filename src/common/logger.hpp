#pragma once

#include <string_view>

#include <spdlog/spdlog.h>

namespace dbsnap {

// ── Logger ───────────────────────────────────────────────────────────────────
//
// Library code logs through the spdlog default logger.  The CLI installs a
// colour logger on stderr named "dbsnap" so diagnostics never interleave with
// command output on stdout.

inline constexpr const char* kLoggerName = "dbsnap";

// Install the "dbsnap" stderr logger as the spdlog default at `level`.
// Calling again only changes the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::warn);

// spdlog level names ("trace", "debug", "info", "warn"/"warning",
// "error"/"err", "critical", "off").  Anything else maps to info.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name);

} // namespace dbsnap
