#include "geohash/interleave.hpp"

namespace geohash {

Bitset BitInterleaver::interlace(Bitset lat_bits, Bitset lon_bits, unsigned total_bits) noexcept {
    const AxisBitCounts counts = AxisBitCounts::for_total(total_bits);

    Bitset combined = 0;
    for (unsigned i = 0; i < total_bits; ++i) {
        combined <<= 1;

        if (i % 2 == 0) {
            combined |= (lon_bits >> (counts.longitude - 1 - i / 2)) & 1;
        } else {
            combined |= (lat_bits >> (counts.latitude - 1 - i / 2)) & 1;
        }
    }

    return combined;
}

AxisBitsets BitInterleaver::split(Bitset combined, unsigned total_bits) noexcept {
    AxisBitsets result{0, 0};
    if (total_bits == 0 || total_bits > 64) {
        return result;
    }

    // Left-align so the first code bit sits at bit 63
    combined <<= (64 - total_bits);

    for (unsigned i = 0; i < total_bits; ++i) {
        Bitset msb = (combined >> 63) & 1;

        if (i % 2 == 0) {
            result.longitude = (result.longitude << 1) | msb;
        } else {
            result.latitude = (result.latitude << 1) | msb;
        }

        combined <<= 1;
    }

    return result;
}

} // namespace geohash
