#pragma once

#include <cstdint>
#include <string_view>

namespace geohash {

// Coordinate domain
constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

constexpr unsigned BITS_PER_CHAR = 5;
constexpr unsigned MIN_HASH_LENGTH = 1;
constexpr unsigned MAX_HASH_LENGTH = 12;
constexpr unsigned MAX_BITS = MAX_HASH_LENGTH * BITS_PER_CHAR;  // 60, fits uint64_t

// Raw bit accumulator for one axis or for the interleaved code
using Bitset = uint64_t;

/**
 * Hash length in base-32 symbols. Each level adds 5 bits of combined
 * resolution; the comments give the approximate cell size at the equator.
 */
enum class Precision : int {
    Global = 1,     // ~5000 km x 5000 km
    Country = 2,    // ~1250 km x 625 km
    State = 3,      // ~156 km x 156 km
    Region = 4,     // ~39 km x 19.5 km
    City = 5,       // ~4.9 km x 4.9 km
    Street = 6,     // ~1.2 km x 0.61 km
    Building = 7,   // ~152 m x 152 m
    Block = 8,      // ~38 m x 19 m
    House = 9,      // ~4.8 m x 4.8 m
    Room = 10,      // ~1.2 m x 0.6 m
    Point = 11,     // ~15 cm x 15 cm
    SubPoint = 12   // ~1.9 cm x 1.9 cm
};

// Compass directions, ordinal order is significant (index into delta table)
enum class Direction : int {
    N = 0,
    NE = 1,
    E = 2,
    SE = 3,
    S = 4,
    SW = 5,
    W = 6,
    NW = 7
};

constexpr int DIRECTION_COUNT = 8;

constexpr bool is_valid(Precision p) noexcept {
    int v = static_cast<int>(p);
    return v >= static_cast<int>(MIN_HASH_LENGTH) && v <= static_cast<int>(MAX_HASH_LENGTH);
}

constexpr bool is_valid(Direction d) noexcept {
    int v = static_cast<int>(d);
    return v >= static_cast<int>(Direction::N) && v <= static_cast<int>(Direction::NW);
}

// Only meaningful for valid values; out-of-range values render as "?"
std::string_view precision_name(Precision p) noexcept;
std::string_view precision_description(Precision p) noexcept;
std::string_view direction_name(Direction d) noexcept;

/**
 * Parse a direction name ("n", "NE", ...; case-insensitive) or its
 * ordinal ("0".."7").
 * @throws DirectionRangeError on anything else
 */
Direction parse_direction(std::string_view text);

/**
 * Parse a precision given as a number ("1".."12") or a level name
 * ("city", "SubPoint", ...; case-insensitive).
 * @throws PrecisionRangeError on anything else
 */
Precision parse_precision(std::string_view text);

struct LatLng {
    double latitude;
    double longitude;

    constexpr LatLng() noexcept : latitude(0), longitude(0) {}
    constexpr LatLng(double lat, double lon) noexcept : latitude(lat), longitude(lon) {}
};

/**
 * Rectangular cell denoted by a hash. Bounds are inclusive of the
 * minimum edge; the bisector assigns a value equal to a midpoint to the
 * upper half.
 */
struct BBox {
    double min_latitude = 0;
    double max_latitude = 0;
    double min_longitude = 0;
    double max_longitude = 0;

    constexpr double height() const noexcept { return max_latitude - min_latitude; }
    constexpr double width() const noexcept { return max_longitude - min_longitude; }

    constexpr LatLng center() const noexcept {
        return LatLng((min_latitude + max_latitude) / 2.0,
                      (min_longitude + max_longitude) / 2.0);
    }

    constexpr bool contains(double lat, double lon) const noexcept {
        return lat >= min_latitude && lat <= max_latitude &&
               lon >= min_longitude && lon <= max_longitude;
    }
};

// Result of DecodeBBox: the cell center plus its bounds
struct DecodedCell {
    LatLng center;
    BBox bbox;
};

/**
 * Split of a combined bit count between the two axes. Longitude occupies
 * the even (first) positions, so it takes the extra bit when the total is
 * odd.
 */
struct AxisBitCounts {
    unsigned latitude;
    unsigned longitude;

    static constexpr AxisBitCounts for_total(unsigned total_bits) noexcept {
        return AxisBitCounts{total_bits / 2, (total_bits + 1) / 2};
    }

    static constexpr AxisBitCounts for_precision(unsigned precision) noexcept {
        return for_total(precision * BITS_PER_CHAR);
    }
};

} // namespace geohash
