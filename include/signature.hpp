#ifndef SIGNATURE_HPP
#define SIGNATURE_HPP
#include <cstddef>
#include <string>

inline constexpr const char* SIGNATURE_PREFIX = "sha256=";
inline constexpr const char* SIGNATURE_HEADER = "X-Hub-Signature-256";

/**
 * @brief Sign a serialized payload with HMAC-SHA256.
 *
 * Both @p payload and @p secret are used as raw bytes; empty input is valid.
 *
 * @param payload Exact bytes that will be transmitted.
 * @param secret  Shared secret used as the HMAC key.
 * @return Header value of the form `sha256=<64 lowercase hex digits>`.
 * @throws std::runtime_error if OpenSSL fails to produce a digest.
 */
std::string sign_payload(const std::string& payload, const std::string& secret);

/**
 * @brief Check a `sha256=` header value against a payload and secret.
 *
 * The comparison runs in constant time.
 */
bool verify_signature(const std::string& payload, const std::string& secret,
                      const std::string& header);

/** @brief Lowercase hexadecimal encoding of @p len bytes. */
std::string to_hex(const unsigned char* data, size_t len);

#endif // SIGNATURE_HPP
