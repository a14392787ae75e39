#pragma once

#include "geohash/types.hpp"

namespace geohash {

// Final bounds of an axis after replaying its bisection code
struct AxisInterval {
    double min;
    double max;
    double center;
};

/**
 * Binary-interval bisection of a single coordinate axis.
 *
 * Each step halves [left, right] at its midpoint and records which half
 * holds the value: 1 for the upper half (value >= mid), 0 for the lower.
 * The first step produces the most significant bit of the result.
 *
 * Bit counts above 64 are not representable; callers pass at most
 * MAX_BITS / 2 + 1 per axis.
 */
class AxisBisector {
public:
    /**
     * Encode `value` as `bit_count` bisection steps over [left, right].
     * The value is assumed to lie inside the bounds.
     */
    static Bitset encode(double left, double right, double value, unsigned bit_count) noexcept;

    /**
     * Replay `bit_count` bisection steps taken from `bits` (MSB first) and
     * return the resulting interval and its midpoint.
     */
    static AxisInterval decode(Bitset bits, unsigned bit_count, double left, double right) noexcept;

    static Bitset encode_latitude(double latitude, unsigned bit_count) noexcept {
        return encode(MIN_LATITUDE, MAX_LATITUDE, latitude, bit_count);
    }

    static Bitset encode_longitude(double longitude, unsigned bit_count) noexcept {
        return encode(MIN_LONGITUDE, MAX_LONGITUDE, longitude, bit_count);
    }

    static AxisInterval decode_latitude(Bitset bits, unsigned bit_count) noexcept {
        return decode(bits, bit_count, MIN_LATITUDE, MAX_LATITUDE);
    }

    static AxisInterval decode_longitude(Bitset bits, unsigned bit_count) noexcept {
        return decode(bits, bit_count, MIN_LONGITUDE, MAX_LONGITUDE);
    }
};

} // namespace geohash
