#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace RID {
    // base62 alphabet, order is fixed: identifiers can be decoded as base62 (or base64 as a subset).
    inline constexpr std::string_view B62Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr std::size_t B62Size = 62;

    // four alphabet periods; 248 = 4 * 62 is the largest multiple of 62 that fits in a byte.
    constexpr std::size_t B62ExtendedSize = 4 * B62Size;

    constexpr std::array<char, B62ExtendedSize> MakeB62ExtendedTable() {
        std::array<char, B62ExtendedSize> table {};
        for (std::size_t i = 0; i < B62ExtendedSize; i++)
            table[i] = B62Alphabet[i % B62Size];
        return table;
    }

    inline constexpr std::array<char, B62ExtendedSize> B62ExtendedTable = MakeB62ExtendedTable();

    static_assert(B62Alphabet.size() == B62Size);
    static_assert(B62ExtendedTable[247] == '9' && B62ExtendedTable[62] == 'A');

    // Maps one raw random byte to a symbol without modulo bias.
    // Bytes in [248, 256) are rejected and replaced by redraw(), which must return an index in [0, 62).
    template<typename F>
    char MapByte(std::uint8_t raw, F &&redraw) {
        if (raw < B62ExtendedSize)
            return B62ExtendedTable[raw];
        return B62Alphabet[static_cast<std::size_t>(redraw())];
    }

    // true when every character of s is in [a-zA-Z0-9]; an empty string is not base62.
    bool IsB62(const std::string &s);
}
