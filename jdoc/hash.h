#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "error.h"

namespace jdoc {

/**
 * Content identity of a document: BLAKE2b-256 of its canonical JSON bytes,
 * as a 64-character lowercase hex string.
 */
struct ContentId {
    std::string hex;

    bool operator==(const ContentId& other) const { return hex == other.hex; }
    bool operator!=(const ContentId& other) const { return hex != other.hex; }
    bool operator<(const ContentId& other) const  { return hex <  other.hex; }
};

/**
 * Compute unkeyed BLAKE2b with a 32-byte digest through OpenSSL's EVP
 * interface. The digest size is a fetch-time parameter of the BLAKE2B-512
 * implementation, which OpenSSL accepts from 3.2 on.
 *
 * @throws Error(invalid_value) if the digest cannot be computed.
 */
inline ContentId hash_bytes(const std::vector<std::uint8_t>& data) {
    constexpr std::size_t digest_size = 32;

    std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)> md(EVP_MD_fetch(nullptr, "BLAKE2B-512", nullptr), &EVP_MD_free);
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    std::size_t size = digest_size;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &size),
        OSSL_PARAM_construct_end(),
    };
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!md || !ctx
        || EVP_DigestInit_ex2(ctx.get(), md.get(), params) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1
        || len != digest_size) {
        throw Error(error_kind::invalid_value,
                    "hash_bytes: BLAKE2b-256 digest failed (OpenSSL 3.2 or newer is required)");
    }

    static const char* hex_digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += hex_digits[digest[i] >> 4];
        hex += hex_digits[digest[i] & 0x0F];
    }
    return ContentId{ hex };
}

} // namespace jdoc
