#include "signature.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += HEX_DIGITS[(data[i] >> 4) & 0x0F];
        out += HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string sign_payload(const std::string& payload, const std::string& secret) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    // HMAC() needs a non-null key pointer even for an empty key.
    static const unsigned char empty_key = 0;
    const void* key = secret.empty() ? static_cast<const void*>(&empty_key)
                                     : static_cast<const void*>(secret.data());
    const unsigned char* res =
        HMAC(EVP_sha256(), key, static_cast<int>(secret.size()),
             reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest,
             &digest_len);
    if (res == nullptr || digest_len != 32)
        throw std::runtime_error("HMAC-SHA256 computation failed");
    return std::string(SIGNATURE_PREFIX) + to_hex(digest, digest_len);
}

bool verify_signature(const std::string& payload, const std::string& secret,
                      const std::string& header) {
    std::string expected = sign_payload(payload, secret);
    if (header.size() != expected.size())
        return false;
    return CRYPTO_memcmp(header.data(), expected.data(), expected.size()) == 0;
}
