#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace RID {
    // One pseudorandom stream. Not thread safe on its own, DualStream guards it.
    class Stream {
        std::mt19937_64 engine;

    public:
        explicit Stream(std::uint64_t seed) : engine(seed) {}

        void Seed(std::uint64_t seed) { engine.seed(seed); }

        // fills buf with raw bytes, eight per engine draw
        void Read(std::vector<std::uint8_t> &buf);

        // uniform in [0, n)
        int Intn(int n);
    };

    // Fast identifier generator: two interleaved streams behind one mutex.
    // Stream A feeds even positions, stream B odd ones. Both are reseeded from the
    // crypto source whenever the first byte each stream produced in a call is zero
    // (probability 1/65536 per call).
    // Output is close to uniform but not cryptographically proven; use NewIdentifierCrypto for that.
    class DualStream {
        std::mutex lk;
        Stream r1;
        Stream r2;
        std::atomic<std::uint64_t> reseedCount {0};

        void ReseedLocked(std::uint64_t seedA, std::uint64_t seedB);

    public:
        // seeded from the crypto source
        DualStream();
        // deterministic, for tests
        DualStream(std::uint64_t seedA, std::uint64_t seedB);

        DualStream(const DualStream &) = delete;
        DualStream &operator=(const DualStream &) = delete;

        std::string Generate(std::size_t n);

        void Reseed(std::uint64_t seedA, std::uint64_t seedB);
        void ReseedFromCrypto();

        // opportunistic reseeds done by Generate
        std::uint64_t ReseedCount() const { return reseedCount.load(); }
    };

    // process wide instance used by NewIdentifier16/20; created on first use, never destroyed.
    DualStream &DefaultStream();
}
