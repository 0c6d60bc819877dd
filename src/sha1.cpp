//
//  sha1.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sha1.hpp"

#include <openssl/evp.h>

#include <memory>

#include "logging.hpp"

namespace tonieforge {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::vector<uint8_t> sha1(const uint8_t *data, size_t len) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    TF_ENSURE(ctx != nullptr, "EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const bool ok = EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) &&
                    EVP_DigestUpdate(ctx.get(), data, len) &&
                    EVP_DigestFinal_ex(ctx.get(), digest, &digest_len);
    TF_ENSURE(ok && digest_len == 20, "SHA-1 digest failed");
    return std::vector<uint8_t>(digest, digest + digest_len);
}

std::string to_hex(const std::vector<uint8_t> &bytes) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

}  // namespace tonieforge
