#include "DualStream.h"
#include <fmt/format.h>

#include "Alphabet.h"
#include "CryptoRandom.h"
#include "logger.h"

using namespace RID;

void Stream::Read(std::vector<std::uint8_t> &buf) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < buf.size(); i++) {
        if (i % 8 == 0) val = engine();
        buf[i] = static_cast<std::uint8_t>(val);
        val >>= 8;
    }
}

int Stream::Intn(int n) {
    std::uniform_int_distribution<int> dist(0, n - 1);
    return dist(engine);
}

DualStream::DualStream() : r1(static_cast<std::uint64_t>(NewInt63Crypto())),
                           r2(static_cast<std::uint64_t>(NewInt63Crypto())) {}

DualStream::DualStream(std::uint64_t seedA, std::uint64_t seedB) : r1(seedA), r2(seedB) {}

void DualStream::ReseedLocked(std::uint64_t seedA, std::uint64_t seedB) {
    r1.Seed(seedA);
    r2.Seed(seedB);
}

void DualStream::Reseed(std::uint64_t seedA, std::uint64_t seedB) {
    std::lock_guard _lock(lk);
    ReseedLocked(seedA, seedB);
}

void DualStream::ReseedFromCrypto() {
    auto a = static_cast<std::uint64_t>(NewInt63Crypto());
    auto b = static_cast<std::uint64_t>(NewInt63Crypto());
    Reseed(a, b);
}

std::string DualStream::Generate(std::size_t n) {
    std::lock_guard _lock(lk);
    std::string res(n, '\0');
    std::vector<std::uint8_t> b1(n / 2 + 1);
    std::vector<std::uint8_t> b2(n / 2 + 1);
    r1.Read(b1);
    r2.Read(b2);
    auto redraw = [this] { return r1.Intn(static_cast<int>(B62Size)); };
    for (std::size_t i = 0; i < n; i++) {
        auto c = (i % 2 == 0) ? b1[i / 2] : b2[i / 2];
        res[i] = MapByte(c, redraw);
    }
    // reseed with crypto seed from time to time
    if (b1[0] == 0 && b2[0] == 0) {
        auto a = static_cast<std::uint64_t>(NewInt63Crypto());
        auto b = static_cast<std::uint64_t>(NewInt63Crypto());
        ReseedLocked(a, b);
        auto count = ++reseedCount;
        ShowLogOnVerboseDetail(fmt::format("RID: fast streams reseeded from crypto source ({} so far)", count));
    }
    return res;
}

DualStream &RID::DefaultStream() {
    static DualStream *instance = new DualStream();
    return *instance;
}
