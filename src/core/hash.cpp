#include "core/utils.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace gatekeeper::utils {

namespace {

constexpr size_t kShortHashLength = 16;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

std::string short_hash(std::string_view value) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("short_hash: EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("short_hash: SHA-256 digest failed");
    }

    // Only the first 8 bytes are needed for 16 hex chars
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(kShortHashLength);
    for (unsigned int i = 0; i < hash_len && hex.size() < kShortHashLength; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace gatekeeper::utils
