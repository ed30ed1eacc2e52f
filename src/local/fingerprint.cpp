#include "dsync/local/fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace dsync::local {
namespace fs = std::filesystem;
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string digest_to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

Result<DigestContext> make_context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err<DigestContext>(ErrorKind::Io, "Failed to initialise MD5 context");
    }
    return Ok(std::move(ctx));
}

Result<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return Err<std::string>(ErrorKind::Io, "Failed to finalise MD5 digest");
    }
    return Ok(digest_to_hex(digest, length));
}

} // namespace

Result<std::string> fingerprint_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    auto ctx = make_context();
    if (ctx.is_error()) {
        return Err<std::string>(ctx.error());
    }

    std::array<char, kFingerprintChunkSize> buffer{};
    while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.value().get(), buffer.data(), count) != 1) {
            return Err<std::string>(ErrorKind::Io, "Failed to hash file: " + path.string());
        }
    }

    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read file: " + path.string());
    }

    return finish(ctx.value().get());
}

std::string fingerprint_bytes(const std::string& data) {
    auto ctx = make_context();
    if (ctx.is_error()) {
        return {};
    }
    if (EVP_DigestUpdate(ctx.value().get(), data.data(), data.size()) != 1) {
        return {};
    }
    auto digest = finish(ctx.value().get());
    return digest.is_ok() ? digest.value() : std::string{};
}

} // namespace dsync::local
