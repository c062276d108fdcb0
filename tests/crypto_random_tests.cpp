// RAND_set_rand_method is deprecated in OpenSSL 3 but still consulted by RAND_bytes
#define OPENSSL_SUPPRESS_DEPRECATED
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <set>
#include <openssl/err.h>
#include <openssl/rand.h>
#include "CryptoRandom.h"
#include "Alphabet.h"
#include "DualStream.h"
#include "rid.h"

TEST(CryptoRandom, Int63IsNonNegative) {
    std::set<std::int64_t> values;
    for (int i = 0; i < 1000; i++) {
        auto v = RID::NewInt63Crypto();
        EXPECT_GE(v, 0);
        values.insert(v);
    }
    EXPECT_GT(values.size(), 990u);
}

TEST(CryptoRandom, Int63UsesFullWidth) {
    // a limit truncated to 32 bits would keep every draw below 2^32
    int above32 = 0;
    for (int i = 0; i < 1000; i++) {
        if (RID::NewInt63Crypto() > std::numeric_limits<std::uint32_t>::max())
            above32++;
    }
    EXPECT_GT(above32, 900);
}

TEST(CryptoRandom, Mod62StaysInRangeAndCoversIt) {
    std::set<int> seen;
    for (int i = 0; i < 10000; i++) {
        auto v = RID::NewMod62Crypto();
        ASSERT_LT(v, 62);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 62u);
}

TEST(CryptoRandom, IdentifierHasRequestedLengthAndAlphabet) {
    for (std::size_t n : {1u, 16u, 20u, 64u}) {
        auto s = RID::NewIdentifierCrypto(n);
        EXPECT_EQ(s.size(), n);
        EXPECT_TRUE(RID::IsB62(s)) << s;
    }
    EXPECT_TRUE(RID::NewIdentifierCrypto(0).empty());
}

namespace {
    int FailBytes(unsigned char *, int) { return 0; }
    int NotSeeded() { return 0; }

    const RAND_METHOD failingRand = {
        nullptr,    // seed
        FailBytes,  // bytes
        nullptr,    // cleanup
        nullptr,    // add
        FailBytes,  // pseudorand
        NotSeeded,  // status
    };
}

// every RAND_bytes call fails while the fixture is active
class BrokenEntropyTest : public ::testing::Test {
protected:
    const RAND_METHOD *saved = nullptr;

    void SetUp() override {
        saved = RAND_get_rand_method();
        ASSERT_EQ(RAND_set_rand_method(&failingRand), 1);
    }
    void TearDown() override {
        RAND_set_rand_method(saved);
        ERR_clear_error();
    }
};

TEST_F(BrokenEntropyTest, PrimitivesThrow) {
    EXPECT_THROW(RID::NewInt63Crypto(), RID::EntropySourceFailure);
    EXPECT_THROW(RID::NewMod62Crypto(), RID::EntropySourceFailure);
}

TEST_F(BrokenEntropyTest, NoPartialIdentifier) {
    std::string id = "untouched";
    EXPECT_THROW(id = RID::NewIdentifierCrypto(20), RID::EntropySourceFailure);
    EXPECT_EQ(id, "untouched");
    EXPECT_THROW(RID::NewIdentifier20Crypto(), RID::EntropySourceFailure);
}

TEST_F(BrokenEntropyTest, NumericIdThrows) {
    EXPECT_THROW(RID::NewNumericId(), RID::EntropySourceFailure);
}

TEST_F(BrokenEntropyTest, DualStreamConstructionThrows) {
    EXPECT_THROW(RID::DualStream s, RID::EntropySourceFailure);
    RID::DualStream seeded(1, 2);
    EXPECT_THROW(seeded.ReseedFromCrypto(), RID::EntropySourceFailure);
    // explicit seeds need no entropy
    EXPECT_EQ(seeded.Generate(20).size(), 20u);
}

TEST_F(BrokenEntropyTest, FailureMessageNamesTheCall) {
    try {
        RID::NewInt63Crypto();
        FAIL() << "expected EntropySourceFailure";
    } catch (const RID::EntropySourceFailure &e) {
        EXPECT_NE(std::string(e.what()).find("BN_rand_range failed"), std::string::npos) << e.what();
    }
}
