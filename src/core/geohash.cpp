#include "geohash/geohash.hpp"

#include <cmath>
#include <cstdlib>

#include "geohash/base32.hpp"
#include "geohash/bisect.hpp"
#include "geohash/interleave.hpp"
#include "geohash/logging.hpp"

namespace geohash {

namespace {

// Unit steps in the order N, NE, E, SE, S, SW, W, NW: (latitude, longitude)
struct DirectionStep {
    int lat;
    int lon;
};

constexpr std::array<DirectionStep, DIRECTION_COUNT> DIRECTION_STEPS = {{
    {+1,  0},   // N
    {+1, +1},   // NE
    { 0, +1},   // E
    {-1, +1},   // SE
    {-1,  0},   // S
    {-1, -1},   // SW
    { 0, -1},   // W
    {+1, -1},   // NW
}};

double wrap_axis(double value, double half_range) noexcept {
    const double full_range = 2.0 * half_range;
    double wrapped = std::fmod(value + half_range, full_range);
    if (wrapped < 0) {
        wrapped += full_range;
    }
    return wrapped - half_range;
}

struct DecodedAxes {
    AxisInterval latitude;
    AxisInterval longitude;
};

DecodedAxes decode_axes(std::string_view hash) {
    const DecodedBits decoded = Base32::decode(hash);
    const unsigned total_bits = decoded.precision * BITS_PER_CHAR;
    const AxisBitCounts counts = AxisBitCounts::for_total(total_bits);
    const AxisBitsets axes = BitInterleaver::split(decoded.bits, total_bits);

    return DecodedAxes{
        AxisBisector::decode_latitude(axes.latitude, counts.latitude),
        AxisBisector::decode_longitude(axes.longitude, counts.longitude)
    };
}

[[noreturn]] void abort_on(const GeohashException& e) {
    LOG_FATAL(e.what());
    std::abort();
}

} // anonymous namespace

void Geohash::validate_hash_length(std::string_view hash, const char* context) {
    if (hash.size() < MIN_HASH_LENGTH || hash.size() > MAX_HASH_LENGTH) {
        throw InvalidHashError(ErrorCode::INVALID_HASH_LENGTH,
                               "hash length " + std::to_string(hash.size()) +
                               " outside [1, 12]",
                               context);
    }
}

std::string Geohash::encode(double latitude, double longitude, Precision precision) {
    // Written so that NaN fails the range test
    if (!(latitude >= MIN_LATITUDE && latitude <= MAX_LATITUDE)) {
        throw CoordinateRangeError(ErrorCode::LATITUDE_OUT_OF_RANGE,
                                   "latitude " + std::to_string(latitude) + " out of range",
                                   __func__);
    }
    if (!(longitude >= MIN_LONGITUDE && longitude <= MAX_LONGITUDE)) {
        throw CoordinateRangeError(ErrorCode::LONGITUDE_OUT_OF_RANGE,
                                   "longitude " + std::to_string(longitude) + " out of range",
                                   __func__);
    }
    if (!is_valid(precision)) {
        throw PrecisionRangeError("precision " + std::to_string(static_cast<int>(precision)) +
                                  " out of range",
                                  __func__);
    }

    const unsigned length = static_cast<unsigned>(precision);
    const unsigned total_bits = length * BITS_PER_CHAR;
    const AxisBitCounts counts = AxisBitCounts::for_total(total_bits);

    const Bitset lon_bits = AxisBisector::encode_longitude(longitude, counts.longitude);
    const Bitset lat_bits = AxisBisector::encode_latitude(latitude, counts.latitude);
    const Bitset combined = BitInterleaver::interlace(lat_bits, lon_bits, total_bits);

    return Base32::encode(combined, length);
}

LatLng Geohash::decode(std::string_view hash) {
    validate_hash_length(hash, __func__);

    const DecodedAxes axes = decode_axes(hash);
    return LatLng(axes.latitude.center, axes.longitude.center);
}

DecodedCell Geohash::decode_bbox(std::string_view hash) {
    validate_hash_length(hash, __func__);

    const DecodedAxes axes = decode_axes(hash);

    DecodedCell cell;
    cell.center = LatLng(axes.latitude.center, axes.longitude.center);
    cell.bbox.min_latitude = axes.latitude.min;
    cell.bbox.max_latitude = axes.latitude.max;
    cell.bbox.min_longitude = axes.longitude.min;
    cell.bbox.max_longitude = axes.longitude.max;
    return cell;
}

LatLng Geohash::cell_size(unsigned precision) noexcept {
    const AxisBitCounts counts = AxisBitCounts::for_precision(precision);
    return LatLng((MAX_LATITUDE - MIN_LATITUDE) / static_cast<double>(Bitset(1) << counts.latitude),
                  (MAX_LONGITUDE - MIN_LONGITUDE) / static_cast<double>(Bitset(1) << counts.longitude));
}

LatLng Geohash::wrap_coordinates(double latitude, double longitude) noexcept {
    return LatLng(wrap_axis(latitude, MAX_LATITUDE), wrap_axis(longitude, MAX_LONGITUDE));
}

std::string Geohash::neighbor(std::string_view hash, Direction direction) {
    const LatLng center = decode(hash);

    if (!is_valid(direction)) {
        throw DirectionRangeError("direction " + std::to_string(static_cast<int>(direction)) +
                                  " out of range",
                                  __func__);
    }

    const unsigned length = static_cast<unsigned>(hash.size());
    const LatLng step = cell_size(length);
    const DirectionStep& d = DIRECTION_STEPS[static_cast<size_t>(direction)];

    const double lat = center.latitude + d.lat * step.latitude;
    const double lon = center.longitude + d.lon * step.longitude;

    if (lat < MIN_LATITUDE || lat > MAX_LATITUDE) {
        // Latitude wraps modulo 180 without flipping longitude; not a true polar crossing
        LOG_DEBUG("neighbor of '", hash, "' toward ", direction_name(direction),
                  " wraps latitude ", lat, " through the pole");
    }

    const LatLng wrapped = wrap_coordinates(lat, lon);
    return encode(wrapped.latitude, wrapped.longitude, static_cast<Precision>(length));
}

NeighborList Geohash::neighbors(std::string_view hash) {
    NeighborList result;
    for (int i = 0; i < DIRECTION_COUNT; ++i) {
        result[static_cast<size_t>(i)] = neighbor(hash, static_cast<Direction>(i));
    }
    return result;
}

std::string Geohash::must_encode(double latitude, double longitude, Precision precision) {
    try {
        return encode(latitude, longitude, precision);
    } catch (const GeohashException& e) {
        abort_on(e);
    }
}

LatLng Geohash::must_decode(std::string_view hash) {
    try {
        return decode(hash);
    } catch (const GeohashException& e) {
        abort_on(e);
    }
}

DecodedCell Geohash::must_decode_bbox(std::string_view hash) {
    try {
        return decode_bbox(hash);
    } catch (const GeohashException& e) {
        abort_on(e);
    }
}

std::string Geohash::must_neighbor(std::string_view hash, Direction direction) {
    try {
        return neighbor(hash, direction);
    } catch (const GeohashException& e) {
        abort_on(e);
    }
}

NeighborList Geohash::must_neighbors(std::string_view hash) {
    try {
        return neighbors(hash);
    } catch (const GeohashException& e) {
        abort_on(e);
    }
}

} // namespace geohash
