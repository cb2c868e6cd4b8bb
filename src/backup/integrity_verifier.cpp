#include "backup/integrity_verifier.hpp"

#include <array>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

constexpr char kSqliteMagic[] = "SQLite format 3";  // 16 bytes incl. NUL
constexpr std::size_t kSqliteMagicSize = sizeof(kSqliteMagic);

} // anonymous namespace

IntegrityVerifier::IntegrityVerifier(engine::DatabaseEngine& engine)
    : engine_{engine}
{}

bool IntegrityVerifier::has_database_header(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size < kHeaderSize) {
        return false;
    }

    std::ifstream ifs(path, std::ios::binary);
    std::array<char, kSqliteMagicSize> magic{};
    if (!ifs.read(magic.data(), static_cast<std::streamsize>(magic.size()))) {
        return false;
    }
    return std::memcmp(magic.data(), kSqliteMagic, kSqliteMagicSize) == 0;
}

bool IntegrityVerifier::verify(const std::filesystem::path& path) const {
    if (!has_database_header(path)) {
        spdlog::debug("IntegrityVerifier: {} is missing or not a database file",
                      path.string());
        return false;
    }

    const auto rows = engine_.integrity_check(path);
    if (!rows) {
        spdlog::warn("IntegrityVerifier: integrity check could not run on {}",
                     path.string());
        return false;
    }
    if (rows->size() != 1 || rows->front() != "ok") {
        spdlog::warn("IntegrityVerifier: {} failed integrity check ({} problem row(s), first: {})",
                     path.string(), rows->size(),
                     rows->empty() ? std::string{"<none>"} : rows->front());
        return false;
    }
    return true;
}

} // namespace dbsnap::backup
