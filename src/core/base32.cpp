#include "geohash/base32.hpp"
#include "geohash/error.hpp"

namespace geohash {

std::string Base32::encode(Bitset bits, unsigned precision) {
    constexpr Bitset MASK = 0x1F;

    if (!is_valid(static_cast<Precision>(precision))) {
        throw PrecisionRangeError("cannot render " + std::to_string(precision) + " symbols", __func__);
    }

    // Left-align the code so the first symbol occupies bits 63..59
    bits <<= (64 - precision * BITS_PER_CHAR);

    char buf[MAX_HASH_LENGTH];
    for (unsigned i = 0; i < precision; ++i) {
        buf[i] = ALPHABET[(bits >> (64 - BITS_PER_CHAR)) & MASK];
        bits <<= BITS_PER_CHAR;
    }

    return std::string(buf, precision);
}

DecodedBits Base32::decode(std::string_view hash) {
    Bitset bits = 0;

    for (size_t pos = 0; pos < hash.size(); ++pos) {
        int index = index_of(hash[pos]);
        if (index < 0) {
            throw InvalidHashError(ErrorCode::INVALID_HASH_FORMAT,
                                   "invalid character at position " + std::to_string(pos) +
                                   " in hash '" + std::string(hash) + "'",
                                   __func__);
        }

        bits <<= BITS_PER_CHAR;
        bits |= static_cast<Bitset>(index);
    }

    return DecodedBits{bits, static_cast<unsigned>(hash.size())};
}

} // namespace geohash
