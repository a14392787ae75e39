#include "geohash/bisect.hpp"

namespace geohash {

Bitset AxisBisector::encode(double left, double right, double value, unsigned bit_count) noexcept {
    Bitset bits = 0;

    for (unsigned i = 0; i < bit_count; ++i) {
        double mid = (left + right) / 2.0;
        bits <<= 1;

        if (value >= mid) {
            bits |= 1;
            left = mid;
        } else {
            right = mid;
        }
    }

    return bits;
}

AxisInterval AxisBisector::decode(Bitset bits, unsigned bit_count, double left, double right) noexcept {
    for (unsigned i = 0; i < bit_count; ++i) {
        Bitset bit = (bits >> (bit_count - 1 - i)) & 1;
        double mid = (left + right) / 2.0;

        if (bit) {
            left = mid;
        } else {
            right = mid;
        }
    }

    return AxisInterval{left, right, (left + right) / 2.0};
}

} // namespace geohash
