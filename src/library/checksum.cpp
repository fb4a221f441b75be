#include "medialib/library/checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace medialib::library {
namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

Result<std::vector<std::uint8_t>> hash_file(const std::filesystem::path& path) {
    using Digest = std::vector<std::uint8_t>;

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fail<Digest>(ErrorKind::TransientIO, "Failed to open file for hashing: " + path.string());
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        return fail<Digest>(ErrorKind::Internal, "Failed to initialise SHA-1 context");
    }

    std::array<char, kReadBlockSize> buffer{};
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = input.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return fail<Digest>(ErrorKind::Internal, "SHA-1 update failed for " + path.string());
        }
    }

    if (input.bad()) {
        return fail<Digest>(ErrorKind::TransientIO, "Read error while hashing " + path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return fail<Digest>(ErrorKind::Internal, "SHA-1 finalisation failed for " + path.string());
    }

    return Ok(Digest(digest.begin(), digest.begin() + length));
}

std::string to_hex(const std::vector<std::uint8_t>& digest) {
    std::ostringstream oss;
    for (auto byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace medialib::library
