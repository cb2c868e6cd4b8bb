#include "backup/checksum.hpp"

#include <array>
#include <fstream>
#include <memory>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace dbsnap::backup {

namespace {

constexpr std::size_t kReadChunkSize = 64 * 1024;

struct DigestContextFree {
    void operator()(EVP_MD_CTX* ctx) const noexcept { ::EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextFree>;

[[nodiscard]] std::string to_hex(const unsigned char* data, unsigned int len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

} // anonymous namespace

std::optional<std::string> file_checksum(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        spdlog::warn("checksum: {} is not a readable file", path.string());
        return std::nullopt;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        spdlog::warn("checksum: cannot open {}", path.string());
        return std::nullopt;
    }

    DigestContext ctx{::EVP_MD_CTX_new()};
    if (!ctx || ::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr) != 1) {
        spdlog::warn("checksum: cannot initialise SHA-256 digest");
        return std::nullopt;
    }

    std::array<char, kReadChunkSize> buf;
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = ifs.gcount();
        if (n > 0 && ::EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
            spdlog::warn("checksum: digest update failed for {}", path.string());
            return std::nullopt;
        }
    }
    if (ifs.bad()) {
        spdlog::warn("checksum: read error on {}", path.string());
        return std::nullopt;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (::EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        spdlog::warn("checksum: digest finalisation failed for {}", path.string());
        return std::nullopt;
    }
    return to_hex(digest.data(), digest_len);
}

} // namespace dbsnap::backup
