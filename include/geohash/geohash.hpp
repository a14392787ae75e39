#pragma once

#include <array>
#include <string>
#include <string_view>

#include "geohash/error.hpp"
#include "geohash/types.hpp"

namespace geohash {

using NeighborList = std::array<std::string, DIRECTION_COUNT>;

/**
 * Geohash encoding of (latitude, longitude) pairs
 *
 * encode: bisect each axis, interleave (longitude first), render base-32
 * decode: parse base-32, split, replay each axis' bisection
 *
 * All operations are pure and reentrant. Invalid input is reported by
 * throwing a GeohashException subclass carrying the matching ErrorCode.
 * The must_* variants treat invalid input as a programming error: they log
 * it at FATAL level and abort the process.
 */
class Geohash {
public:
    /**
     * Encode a coordinate at the given precision
     * @throws CoordinateRangeError latitude outside [-90, 90] or longitude
     *         outside [-180, 180] (NaN included)
     * @throws PrecisionRangeError precision outside [1, 12]
     */
    static std::string encode(double latitude, double longitude, Precision precision);

    /**
     * Decode a hash to the center of its cell
     * @throws InvalidHashError bad length (INVALID_HASH_LENGTH) or symbol
     *         outside the alphabet (INVALID_HASH_FORMAT)
     */
    static LatLng decode(std::string_view hash);

    // Same as decode, plus the bounds of the cell
    static DecodedCell decode_bbox(std::string_view hash);

    /**
     * Hash of the adjacent cell in `direction`, at the same precision.
     *
     * The cell center is shifted by one cell height/width and wrapped back
     * into range before re-encoding, so crossing the antimeridian or a pole
     * falls out of the coordinate arithmetic rather than from bit carries.
     * Latitude wraps modulo 180 degrees: stepping north from the top row
     * lands on the bottom row at the same longitude.
     *
     * @throws InvalidHashError as decode
     * @throws DirectionRangeError direction outside N..NW
     */
    static std::string neighbor(std::string_view hash, Direction direction);

    // All eight neighbors, indexed by Direction (N, NE, E, SE, S, SW, W, NW)
    static NeighborList neighbors(std::string_view hash);

    static std::string must_encode(double latitude, double longitude, Precision precision);
    static LatLng must_decode(std::string_view hash);
    static DecodedCell must_decode_bbox(std::string_view hash);
    static std::string must_neighbor(std::string_view hash, Direction direction);
    static NeighborList must_neighbors(std::string_view hash);

    /**
     * Height (latitude) and width (longitude) in degrees of a cell at the
     * given hash length. precision must be in [1, 12].
     */
    static LatLng cell_size(unsigned precision) noexcept;

    /**
     * Wrap a coordinate back into [-90, 90) x [-180, 180) using
     * ((v + half) mod full) - half on each axis independently.
     */
    static LatLng wrap_coordinates(double latitude, double longitude) noexcept;

private:
    static void validate_hash_length(std::string_view hash, const char* context);
};

} // namespace geohash
