#include "common/format.hpp"

#include <array>
#include <ctime>

#include <fmt/format.h>

namespace dbsnap {

std::string format_size(std::uintmax_t bytes) {
    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

    if (bytes == 0) {
        return "0 B";
    }

    std::size_t unit = 0;
    double scale = 1.0;
    while (unit + 1 < kUnits.size() && static_cast<double>(bytes) >= scale * 1024.0) {
        scale *= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", static_cast<double>(bytes) / scale, kUnits[unit]);
}

std::string format_duration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }
    if (ms < 60000) {
        return fmt::format("{:.2f}s", static_cast<double>(ms) / 1000.0);
    }
    return fmt::format("{:.2f}m", static_cast<double>(ms) / 60000.0);
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto since_epoch = duration_cast<milliseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto millis = since_epoch - secs;
    if (millis.count() < 0) {  // pre-epoch instants round towards -inf
        secs -= seconds{1};
        millis += seconds{1};
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    ::gmtime_r(&t, &utc);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, millis.count());
}

} // namespace dbsnap
