#ifndef CRYPTO_UTILS_H
#define CRYPTO_UTILS_H

// =============================================================================
// CDC Stream Client: Credential Utilities
// =============================================================================
// Provides:
//   - Lowercase hex encoding of arbitrary bytes
//   - SHA-1 hex digests through the OpenSSL EVP interface
//   - The CDC authentication token: hex("user:") + sha1_hex(password)
// The token is shared by the streaming client (first bytes on the wire) and
// the cdc_users tool (one line of the server's cdcusers file).
// =============================================================================

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <openssl/err.h>

// =============================================================================
// CONSTANTS
// =============================================================================
constexpr size_t SHA1_DIGEST_LEN = 20;
constexpr size_t SHA1_HEX_LEN    = SHA1_DIGEST_LEN * 2;

// =============================================================================
// HEX ENCODING
// =============================================================================
inline std::string to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        out += buf;
    }
    return out;
}

inline std::string to_hex(const std::string& bytes) {
    return to_hex(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

// =============================================================================
// SHA-1 HEX DIGEST
// =============================================================================
// Throws std::runtime_error only if the OpenSSL provider refuses the digest.
// =============================================================================
inline std::string sha1_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;

    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha1(), nullptr) != 1 ||
        md_len != SHA1_DIGEST_LEN) {
        char err[256] = {0};
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("SHA-1 digest failed: ") + err);
    }
    return to_hex(md, md_len);
}

// =============================================================================
// AUTHENTICATION TOKEN
// =============================================================================
// Wire layout, no separator between the two halves:
//   hex(utf8(user + ":")) || sha1_hex(utf8(password))
// Length is always 2 * (len(user) + 1) + 40. Empty user and password are
// valid input.
// =============================================================================
inline std::string encode_credentials(const std::string& user, const std::string& password) {
    return to_hex(user + ":") + sha1_hex(password);
}

#endif
