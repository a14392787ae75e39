/**
 * geohash_c.cpp - C API Implementation
 *
 * Implements the C API declared in geohash_c.h by wrapping the C++ core
 * library. No exception escapes: GeohashException maps to its code, any
 * other std::exception (allocation failure) to GH_ERR_INTERNAL.
 */

#include "geohash_c.h"
#include "geohash/geohash.hpp"

#include <cstring>
#include <string>

using namespace geohash;

/* ============================================================================
 * Internal Conversion Helpers
 * ============================================================================ */

namespace {

inline gh_status_t to_c(ErrorCode code) {
    return static_cast<gh_status_t>(code);
}

inline gh_bbox_t to_c(const BBox& b) {
    return gh_bbox_t{b.min_latitude, b.max_latitude, b.min_longitude, b.max_longitude};
}

inline void copy_hash(const std::string& hash, char* out) {
    std::memcpy(out, hash.data(), hash.size());
    out[hash.size()] = '\0';
}

template<typename Fn>
gh_status_t guarded(Fn&& fn) {
    try {
        fn();
        return GH_OK;
    } catch (const GeohashException& e) {
        return to_c(e.code());
    } catch (const std::exception&) {
        return GH_ERR_INTERNAL;
    }
}

} // anonymous namespace

/* ============================================================================
 * Geohash Functions
 * ============================================================================ */

extern "C" {

gh_status_t gh_encode(double latitude, double longitude, int precision, char* out) {
    if (!out) return GH_ERR_INVALID_ARGUMENT;
    return guarded([&] {
        copy_hash(Geohash::encode(latitude, longitude, static_cast<Precision>(precision)), out);
    });
}

gh_status_t gh_decode(const char* hash, double* latitude, double* longitude) {
    if (!hash || !latitude || !longitude) return GH_ERR_INVALID_ARGUMENT;
    return guarded([&] {
        LatLng center = Geohash::decode(hash);
        *latitude = center.latitude;
        *longitude = center.longitude;
    });
}

gh_status_t gh_decode_bbox(const char* hash, double* latitude, double* longitude,
                           gh_bbox_t* bbox) {
    if (!hash) return GH_ERR_INVALID_ARGUMENT;
    return guarded([&] {
        DecodedCell cell = Geohash::decode_bbox(hash);
        if (latitude) *latitude = cell.center.latitude;
        if (longitude) *longitude = cell.center.longitude;
        if (bbox) *bbox = to_c(cell.bbox);
    });
}

gh_status_t gh_neighbor(const char* hash, int direction, char* out) {
    if (!hash || !out) return GH_ERR_INVALID_ARGUMENT;
    return guarded([&] {
        copy_hash(Geohash::neighbor(hash, static_cast<Direction>(direction)), out);
    });
}

gh_status_t gh_neighbors(const char* hash, char out[GH_DIR_COUNT][GH_HASH_BUFSIZE]) {
    if (!hash || !out) return GH_ERR_INVALID_ARGUMENT;
    return guarded([&] {
        NeighborList list = Geohash::neighbors(hash);
        for (size_t i = 0; i < list.size(); ++i) {
            copy_hash(list[i], out[i]);
        }
    });
}

const char* gh_status_string(gh_status_t status) {
    switch (status) {
        case GH_OK:                         return "ok";
        case GH_ERR_LATITUDE_OUT_OF_RANGE:  return "latitude out of range";
        case GH_ERR_LONGITUDE_OUT_OF_RANGE: return "longitude out of range";
        case GH_ERR_PRECISION_OUT_OF_RANGE: return "precision out of range";
        case GH_ERR_INVALID_HASH_LENGTH:    return "invalid hash length";
        case GH_ERR_INVALID_HASH_FORMAT:    return "invalid hash format";
        case GH_ERR_DIRECTION_OUT_OF_RANGE: return "direction out of range";
        case GH_ERR_INVALID_ARGUMENT:       return "invalid argument";
        case GH_ERR_CONFIG:                 return "configuration error";
        case GH_ERR_INTERNAL:               return "internal error";
    }
    return "unknown status";
}

// The names are string literals, so the views are null-terminated
const char* gh_precision_name(int precision) {
    return precision_name(static_cast<Precision>(precision)).data();
}

const char* gh_direction_name(int direction) {
    return direction_name(static_cast<Direction>(direction)).data();
}

} // extern "C"
