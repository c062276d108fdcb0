#include <gtest/gtest.h>
#include <set>
#include "Alphabet.h"

TEST(Alphabet, Has62DistinctSymbolsInFixedOrder) {
    std::set<char> seen(RID::B62Alphabet.begin(), RID::B62Alphabet.end());
    EXPECT_EQ(seen.size(), RID::B62Size);
    EXPECT_EQ(RID::B62Alphabet.front(), 'A');
    EXPECT_EQ(RID::B62Alphabet[26], 'a');
    EXPECT_EQ(RID::B62Alphabet[52], '0');
    EXPECT_EQ(RID::B62Alphabet.back(), '9');
}

TEST(Alphabet, ExtendedTableRepeatsAlphabetFourTimes) {
    ASSERT_EQ(RID::B62ExtendedTable.size(), 248u);
    for (std::size_t i = 0; i < RID::B62ExtendedTable.size(); i++)
        EXPECT_EQ(RID::B62ExtendedTable[i], RID::B62Alphabet[i % 62]) << "index " << i;
}

TEST(MapByte, InRangeBytesUseTableWithoutRedraw) {
    int redraws = 0;
    auto redraw = [&] { ++redraws; return 0; };
    for (int raw = 0; raw < 248; raw++)
        EXPECT_EQ(RID::MapByte(static_cast<std::uint8_t>(raw), redraw), RID::B62Alphabet[raw % 62]);
    EXPECT_EQ(redraws, 0);
}

TEST(MapByte, OutOfRangeBytesAreRedrawn) {
    int redraws = 0;
    auto redraw = [&] { return redraws++ % 62; };
    for (int raw = 248; raw < 256; raw++)
        EXPECT_EQ(RID::MapByte(static_cast<std::uint8_t>(raw), redraw), RID::B62Alphabet[raw - 248]);
    EXPECT_EQ(redraws, 8);
}

TEST(IsB62, AcceptsOnlyAlphanumerics) {
    EXPECT_TRUE(RID::IsB62("abcXYZ019"));
    EXPECT_TRUE(RID::IsB62(std::string(RID::B62Alphabet)));
    EXPECT_FALSE(RID::IsB62(""));
    EXPECT_FALSE(RID::IsB62("abc-def"));
    EXPECT_FALSE(RID::IsB62("abc_def"));
    EXPECT_FALSE(RID::IsB62("abc def"));
    EXPECT_FALSE(RID::IsB62("abc\xc3\xa9"));
    EXPECT_FALSE(RID::IsB62(std::string("ab\0cd", 5)));
}
