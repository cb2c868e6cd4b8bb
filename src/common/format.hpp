#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dbsnap {

// Human-readable byte count: "0 B", "512.00 B", "1.50 KB", … up to TB.
[[nodiscard]] std::string format_size(std::uintmax_t bytes);

// Human-readable duration: "850ms", "1.25s", "2.50m".
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

// UTC ISO-8601 timestamp with millisecond precision:
// "2026-10-19T05:09:12.345Z".
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point tp);

} // namespace dbsnap
