#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "Alphabet.h"
#include "CryptoRandom.h"
#include "DualStream.h"

// Short random identifiers over the base62 alphabet [A-Za-z0-9].
//
// Three generators share the same output format:
//   NewIdentifier*        fast path, two pseudorandom streams reseeded from the crypto source
//   NewIdentifier*Crypto  every symbol drawn from the OS CSPRNG
//   NewIdentifier*Math    plain std::mt19937, tests and benchmarks only
//
// Uniqueness is probabilistic only (birthday bound). Any generator may throw
// RID::EntropySourceFailure when the system random number generator fails.
namespace RID {
    constexpr std::size_t IdentifierLength16 = 16;
    constexpr std::size_t IdentifierLength20 = 20;
    constexpr std::size_t SignatureBytes = 8;
    constexpr std::size_t SignatureHexLength = 2 * SignatureBytes;
    constexpr std::size_t SignedIdentifierLength = IdentifierLength20 + SignatureHexLength;
    constexpr std::int64_t NumericIdModulus = 1000000000;

    std::string NewIdentifier(std::size_t n);

    // 16 chars of base62: about 95.3 bits of entropy.
    // Around 10^10 generated ids give a collision probability of about 10^-9.
    inline std::string NewIdentifier16() { return NewIdentifier(IdentifierLength16); }

    // 20 chars of base62: about 119.1 bits of entropy.
    inline std::string NewIdentifier20() { return NewIdentifier(IdentifierLength20); }

    inline std::string NewIdentifier16Crypto() { return NewIdentifierCrypto(IdentifierLength16); }
    inline std::string NewIdentifier20Crypto() { return NewIdentifierCrypto(IdentifierLength20); }

    // not for production: no security or uniqueness guarantee
    std::string NewIdentifierMath(std::size_t n);
    inline std::string NewIdentifier16Math() { return NewIdentifierMath(IdentifierLength16); }
    inline std::string NewIdentifier20Math() { return NewIdentifierMath(IdentifierLength20); }

    // first 8 bytes of HMAC-SHA256(secret, message), as 16 lower-case hex chars
    std::string Sign(const std::string &message, const std::string &secret);

    // 20-char identifier followed by its signature, 36 chars total
    std::string NewSignedIdentifier20(const std::string &secret);

    bool ValidateIdentifier(const std::string &s, std::size_t expectedLen);
    inline bool ValidateIdentifier16(const std::string &s) { return ValidateIdentifier(s, IdentifierLength16); }
    inline bool ValidateIdentifier20(const std::string &s) { return ValidateIdentifier(s, IdentifierLength20); }
    bool ValidateSignedIdentifier20(const std::string &s, const std::string &secret);

    // decimal of a crypto random value in [0, 1000000000), not zero padded
    std::string NewNumericId();

    // "123456789" -> "123-456-789", "1234567890" -> "123-456-7890".
    // Throws std::invalid_argument when nid has fewer than 6 chars.
    std::string FormatDashedNumericId(const std::string &nid);
}
