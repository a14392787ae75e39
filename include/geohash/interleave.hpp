#pragma once

#include "geohash/types.hpp"

namespace geohash {

struct AxisBitsets {
    Bitset latitude;
    Bitset longitude;
};

/**
 * Bit interleaving of the two axis codes.
 *
 * Position i of the combined code (0 = most significant of `total_bits`)
 * takes the next longitude bit when i is even and the next latitude bit
 * when i is odd. Longitude therefore leads, and holds ceil(total/2) bits.
 * This ordering is what makes hashes compatible across implementations.
 */
class BitInterleaver {
public:
    static Bitset interlace(Bitset lat_bits, Bitset lon_bits, unsigned total_bits) noexcept;

    // Inverse of interlace; total_bits must be in [1, 64]
    static AxisBitsets split(Bitset combined, unsigned total_bits) noexcept;
};

} // namespace geohash
