#include "geohash/types.hpp"
#include "geohash/error.hpp"

#include <array>
#include <cctype>
#include <string>

namespace geohash {

namespace {

struct PrecisionInfo {
    std::string_view name;
    std::string_view description;
};

constexpr std::array<PrecisionInfo, MAX_HASH_LENGTH> PRECISION_INFO = {{
    {"Global",   "~5000 km x 5000 km"},
    {"Country",  "~1250 km x 625 km"},
    {"State",    "~156 km x 156 km"},
    {"Region",   "~39 km x 19.5 km"},
    {"City",     "~4.9 km x 4.9 km"},
    {"Street",   "~1.2 km x 0.61 km"},
    {"Building", "~152 m x 152 m"},
    {"Block",    "~38 m x 19 m"},
    {"House",    "~4.8 m x 4.8 m"},
    {"Room",     "~1.2 m x 0.6 m"},
    {"Point",    "~15 cm x 15 cm"},
    {"SubPoint", "~1.9 cm x 1.9 cm"},
}};

constexpr std::array<std::string_view, DIRECTION_COUNT> DIRECTION_NAMES = {
    "N", "NE", "E", "SE", "S", "SW", "W", "NW"
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Non-negative decimal integer, -1 if `text` is not one
int parse_small_int(std::string_view text) noexcept {
    if (text.empty() || text.size() > 3) return -1;
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

std::string_view precision_name(Precision p) noexcept {
    if (!is_valid(p)) return "?";
    return PRECISION_INFO[static_cast<size_t>(p) - 1].name;
}

std::string_view precision_description(Precision p) noexcept {
    if (!is_valid(p)) return "?";
    return PRECISION_INFO[static_cast<size_t>(p) - 1].description;
}

std::string_view direction_name(Direction d) noexcept {
    if (!is_valid(d)) return "?";
    return DIRECTION_NAMES[static_cast<size_t>(d)];
}

Direction parse_direction(std::string_view text) {
    int ordinal = parse_small_int(text);
    if (ordinal >= 0 && is_valid(static_cast<Direction>(ordinal))) {
        return static_cast<Direction>(ordinal);
    }
    for (size_t i = 0; i < DIRECTION_NAMES.size(); ++i) {
        if (iequals(text, DIRECTION_NAMES[i])) {
            return static_cast<Direction>(i);
        }
    }
    throw DirectionRangeError("unknown direction '" + std::string(text) + "'", __func__);
}

Precision parse_precision(std::string_view text) {
    int value = parse_small_int(text);
    if (value >= 0 && is_valid(static_cast<Precision>(value))) {
        return static_cast<Precision>(value);
    }
    for (size_t i = 0; i < PRECISION_INFO.size(); ++i) {
        if (iequals(text, PRECISION_INFO[i].name)) {
            return static_cast<Precision>(i + 1);
        }
    }
    throw PrecisionRangeError("unknown precision '" + std::string(text) + "'", __func__);
}

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                return "Success";
        case ErrorCode::LATITUDE_OUT_OF_RANGE:  return "LatitudeOutOfRange";
        case ErrorCode::LONGITUDE_OUT_OF_RANGE: return "LongitudeOutOfRange";
        case ErrorCode::PRECISION_OUT_OF_RANGE: return "PrecisionOutOfRange";
        case ErrorCode::INVALID_HASH_LENGTH:    return "InvalidHashLength";
        case ErrorCode::INVALID_HASH_FORMAT:    return "InvalidHashFormat";
        case ErrorCode::DIRECTION_OUT_OF_RANGE: return "DirectionOutOfRange";
        case ErrorCode::INVALID_ARGUMENT:       return "InvalidArgument";
        case ErrorCode::CONFIG_ERROR:           return "ConfigError";
        case ErrorCode::INTERNAL_ERROR:         return "InternalError";
    }
    return "Unknown";
}

} // namespace geohash
