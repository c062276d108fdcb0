#include "CryptoRandom.h"
#include <limits>
#include <memory>
#include <fmt/format.h>
#include <openssl/bn.h>
#include <openssl/err.h>

#include "Alphabet.h"
#include "logger.h"

namespace {
    struct BNDeleter {
        void operator()(BIGNUM *b) const { BN_free(b); }
    };
    using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;

    // the 63-bit limit and result travel through BN_set_word/BN_get_word
    static_assert(sizeof(BN_ULONG) >= sizeof(std::uint64_t), "BN_ULONG narrower than 64 bits");

    [[noreturn]] void ThrowEntropyFailure(const char *where) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        auto msg = fmt::format("{} failed: {}", where, buf);
        // severe error - looks like a failure of system random number generator
        ShowLogCritical(fmt::format("RID: system random number generator failure, {}", msg));
        throw RID::EntropySourceFailure(msg);
    }

    std::uint64_t UniformBelow(std::uint64_t range) {
        BNPtr limit(BN_new());
        BNPtr r(BN_new());
        if (!limit || !r)
            ThrowEntropyFailure("BN_new");
        if (BN_set_word(limit.get(), range) != 1)
            ThrowEntropyFailure("BN_set_word");
        // BN_rand_range draws from RAND_bytes and rejects out of range candidates
        if (BN_rand_range(r.get(), limit.get()) != 1)
            ThrowEntropyFailure("BN_rand_range");
        return BN_get_word(r.get());
    }
}

std::int64_t RID::NewInt63Crypto() {
    return static_cast<std::int64_t>(UniformBelow(std::numeric_limits<std::int64_t>::max()));
}

std::uint8_t RID::NewMod62Crypto() {
    return static_cast<std::uint8_t>(UniformBelow(B62Size));
}

std::string RID::NewIdentifierCrypto(std::size_t n) {
    std::string res(n, '\0');
    for (std::size_t i = 0; i < n; i++)
        res[i] = B62Alphabet[NewMod62Crypto()];
    return res;
}
