#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace geohash {

/**
 * Error taxonomy. Every failure is an input-validation failure: none is
 * transient, so none is worth retrying. Values are mirrored one-to-one by
 * gh_status_t in the C API.
 */
enum class ErrorCode {
    SUCCESS = 0,

    // Input validation
    LATITUDE_OUT_OF_RANGE = 1,
    LONGITUDE_OUT_OF_RANGE = 2,
    PRECISION_OUT_OF_RANGE = 3,
    INVALID_HASH_LENGTH = 4,
    INVALID_HASH_FORMAT = 5,
    DIRECTION_OUT_OF_RANGE = 6,

    // Front-end errors
    INVALID_ARGUMENT = 100,
    CONFIG_ERROR = 101,

    // Internal errors
    INTERNAL_ERROR = 500
};

std::string_view error_code_name(ErrorCode code) noexcept;

class GeohashException : public std::runtime_error {
public:
    explicit GeohashException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Geohash error [" + std::string(error_code_name(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Latitude or longitude outside its domain
class CoordinateRangeError : public GeohashException {
public:
    CoordinateRangeError(ErrorCode code, const std::string& message,
                         const std::string& context = "")
        : GeohashException(code, message, context,
                           "latitude must lie in [-90, 90] and longitude in [-180, 180]") {}
};

class PrecisionRangeError : public GeohashException {
public:
    explicit PrecisionRangeError(const std::string& message,
                                 const std::string& context = "")
        : GeohashException(ErrorCode::PRECISION_OUT_OF_RANGE, message, context,
                           "precision must lie in [1, 12]") {}
};

// Hash of bad length or containing a symbol outside the alphabet
class InvalidHashError : public GeohashException {
public:
    InvalidHashError(ErrorCode code, const std::string& message,
                     const std::string& context = "")
        : GeohashException(code, message, context) {}
};

class DirectionRangeError : public GeohashException {
public:
    explicit DirectionRangeError(const std::string& message,
                                 const std::string& context = "")
        : GeohashException(ErrorCode::DIRECTION_OUT_OF_RANGE, message, context,
                           "direction must be one of N, NE, E, SE, S, SW, W, NW") {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw GeohashException(code, message, context, suggestion);
        }
    }
};

#define GEOHASH_CHECK(condition, code, message) \
    geohash::ErrorHandler::check_condition(condition, code, message, __func__)

#define GEOHASH_CHECK_ARGUMENT(condition, message) \
    GEOHASH_CHECK(condition, geohash::ErrorCode::INVALID_ARGUMENT, message)

#define GEOHASH_THROW(code, message) \
    throw geohash::GeohashException(code, message, __func__)

} // namespace geohash
