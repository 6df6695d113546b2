#include "package/hashing.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <vector>

namespace apidiff::package {

auto sha512_base64(const ByteBuffer& bytes) -> std::optional<std::string> {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        return std::nullopt;
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha512(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, digest, &len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        return std::nullopt;
    }

    // 4 output chars per 3 input bytes, plus the terminator
    std::vector<unsigned char> encoded(4 * ((len + 2) / 3) + 1);
    int written = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(len));
    if (written < 0) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(encoded.data()),
                       static_cast<size_t>(written));
}

auto random_hex(size_t byte_count) -> std::optional<std::string> {
    std::vector<unsigned char> raw(byte_count);
    if (byte_count > 0 && RAND_bytes(raw.data(), static_cast<int>(byte_count)) != 1) {
        return std::nullopt;
    }
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(byte_count * 2);
    for (unsigned char b : raw) {
        out.push_back(HEX[b >> 4]);
        out.push_back(HEX[b & 0x0F]);
    }
    return out;
}

} // namespace apidiff::package
