/**
 * geohash_c.h - C API for the geohash library
 *
 * Pure C interface to the C++ geohash core. It is what the PostgreSQL
 * extension (compiled as C) links against, and is usable from any other
 * C code or FFI.
 *
 * Architecture:
 *   - C++ core library: encoding, decoding and neighbor arithmetic
 *   - C API (this file): extern "C" bridge; exceptions become status codes
 *   - PostgreSQL extension: pure C, includes PG headers, calls this C API
 */

#ifndef GEOHASH_C_H
#define GEOHASH_C_H

#include <stddef.h>
#include <stdint.h>

/* DLL export/import macros for Windows */
#ifdef _WIN32
    #ifdef GEOHASH_C_EXPORTS
        #define GH_API __declspec(dllexport)
    #else
        #define GH_API __declspec(dllimport)
    #endif
#else
    #define GH_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Type Definitions
 * ============================================================================ */

/** Result of every fallible call; values match geohash::ErrorCode */
typedef enum {
    GH_OK = 0,
    GH_ERR_LATITUDE_OUT_OF_RANGE = 1,
    GH_ERR_LONGITUDE_OUT_OF_RANGE = 2,
    GH_ERR_PRECISION_OUT_OF_RANGE = 3,
    GH_ERR_INVALID_HASH_LENGTH = 4,
    GH_ERR_INVALID_HASH_FORMAT = 5,
    GH_ERR_DIRECTION_OUT_OF_RANGE = 6,
    GH_ERR_INVALID_ARGUMENT = 100,
    GH_ERR_CONFIG = 101,
    GH_ERR_INTERNAL = 500
} gh_status_t;

/** Compass direction, ordinal order is significant */
typedef enum {
    GH_DIR_N = 0,
    GH_DIR_NE,
    GH_DIR_E,
    GH_DIR_SE,
    GH_DIR_S,
    GH_DIR_SW,
    GH_DIR_W,
    GH_DIR_NW,
    GH_DIR_COUNT
} gh_direction_t;

/** Bounds of the cell a hash denotes */
typedef struct {
    double min_latitude;
    double max_latitude;
    double min_longitude;
    double max_longitude;
} gh_bbox_t;

/* ============================================================================
 * Constants
 * ============================================================================ */

#define GH_MIN_PRECISION    1
#define GH_MAX_PRECISION    12
#define GH_HASH_BUFSIZE     13  /* longest hash plus terminator */

/* ============================================================================
 * Geohash Functions
 * ============================================================================ */

/**
 * Encode a coordinate
 * @param latitude  Latitude in [-90, 90]
 * @param longitude Longitude in [-180, 180]
 * @param precision Hash length in [1, 12]
 * @param out       Output buffer of at least GH_HASH_BUFSIZE bytes
 * @return GH_OK or the validation failure; `out` is untouched on failure
 */
GH_API gh_status_t gh_encode(double latitude, double longitude, int precision, char* out);

/**
 * Decode a null-terminated hash to its cell center
 */
GH_API gh_status_t gh_decode(const char* hash, double* latitude, double* longitude);

/**
 * Decode a null-terminated hash to its cell center and bounds
 * Any of the output pointers may be NULL.
 */
GH_API gh_status_t gh_decode_bbox(const char* hash, double* latitude, double* longitude,
                                  gh_bbox_t* bbox);

/**
 * Adjacent cell in one direction, same precision as `hash`
 * @param direction gh_direction_t value (passed as int so that out-of-range
 *                  values are reported, not undefined)
 * @param out       Output buffer of at least GH_HASH_BUFSIZE bytes
 */
GH_API gh_status_t gh_neighbor(const char* hash, int direction, char* out);

/**
 * All eight neighbors in N, NE, E, SE, S, SW, W, NW order
 * @param out Eight buffers of GH_HASH_BUFSIZE bytes; untouched on failure
 */
GH_API gh_status_t gh_neighbors(const char* hash, char out[GH_DIR_COUNT][GH_HASH_BUFSIZE]);

/**
 * Static description of a status code (do not free)
 */
GH_API const char* gh_status_string(gh_status_t status);

/**
 * Static name of a precision level ("Global" .. "SubPoint"), "?" if invalid
 */
GH_API const char* gh_precision_name(int precision);

/**
 * Static name of a direction ("N" .. "NW"), "?" if invalid
 */
GH_API const char* gh_direction_name(int direction);

#ifdef __cplusplus
}
#endif

#endif /* GEOHASH_C_H */
