#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace RID {
    // The system random number generator failed. Not retryable: callers must treat it as fatal.
    class EntropySourceFailure : public std::runtime_error {
    public:
        explicit EntropySourceFailure(const std::string &what) : std::runtime_error(what) {}
    };

    // uniform in [0, INT64_MAX), drawn from the OS backed CSPRNG. Seeds the fast streams.
    std::int64_t NewInt63Crypto();

    // uniform in [0, 62) through a big-integer range draw (no modulo of a fixed width read).
    std::uint8_t NewMod62Crypto();

    // every symbol comes from the crypto source. Slower than NewIdentifier(n), no shared state.
    std::string NewIdentifierCrypto(std::size_t n);
}
