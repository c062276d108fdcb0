#include "hmac.h"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

static void handle_openssl_error() {
    throw std::runtime_error("ssl fatal error: HMAC-SHA256 failed");
}

std::string UsingOpenSSL::hmac_sha256(const std::string &message, const std::string &secret, std::size_t bytes) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    auto ret = HMAC(EVP_sha256(),
                    secret.data(), static_cast<int>(secret.size()),
                    reinterpret_cast<const unsigned char *>(message.data()), message.size(),
                    hash, &len);
    if (ret == nullptr || len != SHA256_DIGEST_LENGTH)
        handle_openssl_error();

    std::string res;
    res.reserve(2 * bytes);
    auto n = std::min<std::size_t>(bytes, len);
    for (std::size_t i = 0; i < n; i++) {
        res.append(fmt::format("{:02x}", hash[i]));
    }
    return res;
}

bool UsingOpenSSL::constant_time_equal(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
