#pragma once
#include <cstddef>
#include <string>

namespace UsingOpenSSL {
    // hex of the first `bytes` bytes of HMAC-SHA256(secret, message); bytes is capped at 32
    std::string hmac_sha256(const std::string &message, const std::string &secret, std::size_t bytes = 32);

    // comparison time depends only on the lengths, not on where the strings differ
    bool constant_time_equal(const std::string &a, const std::string &b);
}
