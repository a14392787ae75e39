#pragma once

#include <array>
#include <string>
#include <string_view>

#include "geohash/types.hpp"

namespace geohash {

struct DecodedBits {
    Bitset bits;
    unsigned precision;
};

constexpr std::string_view GEOHASH_ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";

namespace detail {

constexpr std::array<signed char, 256> build_reverse_alphabet() noexcept {
    std::array<signed char, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (size_t i = 0; i < GEOHASH_ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(GEOHASH_ALPHABET[i])] = static_cast<signed char>(i);
    }
    return table;
}

} // namespace detail

/**
 * Geohash base-32 codec, 5 bits per symbol, most significant symbol first.
 *
 * The alphabet is digits then lowercase letters without a, i, l and o.
 * Its order defines the value of each symbol. Lookup is case-sensitive:
 * uppercase input is rejected rather than folded.
 */
class Base32 {
public:
    static constexpr std::string_view ALPHABET = GEOHASH_ALPHABET;

    // Symbol value in [0, 31], or -1 when `c` is not in the alphabet
    static constexpr int index_of(char c) noexcept {
        return REVERSE[static_cast<unsigned char>(c)];
    }

    static constexpr bool is_valid_char(char c) noexcept {
        return index_of(c) >= 0;
    }

    /**
     * Render the low `precision * 5` bits of `bits` as `precision` symbols.
     * @throws PrecisionRangeError when precision is outside [1, 12]
     */
    static std::string encode(Bitset bits, unsigned precision);

    /**
     * Parse a hash into its bit code. The precision is the hash length.
     * @throws InvalidHashError (INVALID_HASH_FORMAT) on a symbol outside
     *         the alphabet
     */
    static DecodedBits decode(std::string_view hash);

private:
    static constexpr std::array<signed char, 256> REVERSE = detail::build_reverse_alphabet();
};

} // namespace geohash
