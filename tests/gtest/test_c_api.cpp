// =============================================================================
// C API Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geohash_c.h"
#include "geohash/error.hpp"

#include <cstring>
#include <iterator>
#include <set>
#include <string>
#include <utility>

class CApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::memset(buf_, 'x', sizeof(buf_));
    }
    void TearDown() override {}

    char buf_[GH_HASH_BUFSIZE];
};

TEST_F(CApiTest, Encode) {
    ASSERT_EQ(gh_encode(37.7749, -122.4194, 5, buf_), GH_OK);
    EXPECT_STREQ(buf_, "9q8yy");

    ASSERT_EQ(gh_encode(37.7749, -122.4194, GH_MAX_PRECISION, buf_), GH_OK);
    EXPECT_STREQ(buf_, "9q8yyk8ytpxr");
}

TEST_F(CApiTest, EncodeErrors) {
    EXPECT_EQ(gh_encode(91, 0, 5, buf_), GH_ERR_LATITUDE_OUT_OF_RANGE);
    EXPECT_EQ(gh_encode(0, -181, 5, buf_), GH_ERR_LONGITUDE_OUT_OF_RANGE);
    EXPECT_EQ(gh_encode(0, 0, 0, buf_), GH_ERR_PRECISION_OUT_OF_RANGE);
    EXPECT_EQ(gh_encode(0, 0, 13, buf_), GH_ERR_PRECISION_OUT_OF_RANGE);
    EXPECT_EQ(gh_encode(0, 0, 5, nullptr), GH_ERR_INVALID_ARGUMENT);

    // Output untouched on failure
    EXPECT_EQ(buf_[0], 'x');
}

TEST_F(CApiTest, Decode) {
    double lat = 0;
    double lon = 0;
    ASSERT_EQ(gh_decode("9", &lat, &lon), GH_OK);
    EXPECT_DOUBLE_EQ(lat, 22.5);
    EXPECT_DOUBLE_EQ(lon, -112.5);

    EXPECT_EQ(gh_decode("", &lat, &lon), GH_ERR_INVALID_HASH_LENGTH);
    EXPECT_EQ(gh_decode("9q8yyk8ytpxrs", &lat, &lon), GH_ERR_INVALID_HASH_LENGTH);
    EXPECT_EQ(gh_decode("9q8yy!", &lat, &lon), GH_ERR_INVALID_HASH_FORMAT);
    EXPECT_EQ(gh_decode(nullptr, &lat, &lon), GH_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(gh_decode("9", nullptr, &lon), GH_ERR_INVALID_ARGUMENT);
}

TEST_F(CApiTest, DecodeBBox) {
    gh_bbox_t bbox;
    double lat = 0;
    double lon = 0;
    ASSERT_EQ(gh_decode_bbox("9q8yy", &lat, &lon, &bbox), GH_OK);
    EXPECT_DOUBLE_EQ(lat, 37.77099609375);
    EXPECT_DOUBLE_EQ(lon, -122.40966796875);
    EXPECT_DOUBLE_EQ(bbox.min_latitude, 37.7490234375);
    EXPECT_DOUBLE_EQ(bbox.max_latitude, 37.79296875);
    EXPECT_DOUBLE_EQ(bbox.min_longitude, -122.431640625);
    EXPECT_DOUBLE_EQ(bbox.max_longitude, -122.3876953125);

    // Outputs are optional
    ASSERT_EQ(gh_decode_bbox("9", nullptr, nullptr, &bbox), GH_OK);
    EXPECT_DOUBLE_EQ(bbox.max_latitude, 45.0);
    EXPECT_EQ(gh_decode_bbox("9", nullptr, nullptr, nullptr), GH_OK);

    EXPECT_EQ(gh_decode_bbox("a", nullptr, nullptr, &bbox), GH_ERR_INVALID_HASH_FORMAT);
}

TEST_F(CApiTest, Neighbor) {
    ASSERT_EQ(gh_neighbor("9q8yy", GH_DIR_N, buf_), GH_OK);
    EXPECT_STREQ(buf_, "9q8zn");

    ASSERT_EQ(gh_neighbor("zzzzz", GH_DIR_NE, buf_), GH_OK);
    EXPECT_STREQ(buf_, "00000");

    EXPECT_EQ(gh_neighbor("9q8yy", GH_DIR_COUNT, buf_), GH_ERR_DIRECTION_OUT_OF_RANGE);
    EXPECT_EQ(gh_neighbor("9q8yy", -1, buf_), GH_ERR_DIRECTION_OUT_OF_RANGE);
    EXPECT_EQ(gh_neighbor("", 8, buf_), GH_ERR_INVALID_HASH_LENGTH);
}

TEST_F(CApiTest, Neighbors) {
    char out[GH_DIR_COUNT][GH_HASH_BUFSIZE];
    ASSERT_EQ(gh_neighbors("9", out), GH_OK);

    const char* expected[GH_DIR_COUNT] = {"c", "f", "d", "6", "3", "2", "8", "b"};
    for (int i = 0; i < GH_DIR_COUNT; ++i) {
        EXPECT_STREQ(out[i], expected[i]) << gh_direction_name(i);
    }

    EXPECT_EQ(gh_neighbors("9q8yy!", out), GH_ERR_INVALID_HASH_FORMAT);
    EXPECT_EQ(gh_neighbors(nullptr, out), GH_ERR_INVALID_ARGUMENT);
}

TEST_F(CApiTest, Names) {
    EXPECT_STREQ(gh_status_string(GH_OK), "ok");
    EXPECT_STREQ(gh_status_string(GH_ERR_INVALID_HASH_FORMAT), "invalid hash format");
    EXPECT_STREQ(gh_precision_name(5), "City");
    EXPECT_STREQ(gh_precision_name(0), "?");
    EXPECT_STREQ(gh_direction_name(GH_DIR_SW), "SW");
    EXPECT_STREQ(gh_direction_name(9), "?");
}

// Every ErrorCode has a status of the same value and a description of its own
TEST_F(CApiTest, StatusMirrorsErrorCode) {
    using geohash::ErrorCode;
    const std::pair<ErrorCode, gh_status_t> pairs[] = {
        {ErrorCode::SUCCESS, GH_OK},
        {ErrorCode::LATITUDE_OUT_OF_RANGE, GH_ERR_LATITUDE_OUT_OF_RANGE},
        {ErrorCode::LONGITUDE_OUT_OF_RANGE, GH_ERR_LONGITUDE_OUT_OF_RANGE},
        {ErrorCode::PRECISION_OUT_OF_RANGE, GH_ERR_PRECISION_OUT_OF_RANGE},
        {ErrorCode::INVALID_HASH_LENGTH, GH_ERR_INVALID_HASH_LENGTH},
        {ErrorCode::INVALID_HASH_FORMAT, GH_ERR_INVALID_HASH_FORMAT},
        {ErrorCode::DIRECTION_OUT_OF_RANGE, GH_ERR_DIRECTION_OUT_OF_RANGE},
        {ErrorCode::INVALID_ARGUMENT, GH_ERR_INVALID_ARGUMENT},
        {ErrorCode::CONFIG_ERROR, GH_ERR_CONFIG},
        {ErrorCode::INTERNAL_ERROR, GH_ERR_INTERNAL},
    };

    std::set<std::string> descriptions;
    for (const auto& [code, status] : pairs) {
        EXPECT_EQ(static_cast<int>(code), static_cast<int>(status)) << geohash::error_code_name(code);
        std::string description = gh_status_string(status);
        EXPECT_NE(description, "unknown status") << geohash::error_code_name(code);
        descriptions.insert(description);
    }
    EXPECT_EQ(descriptions.size(), std::size(pairs));

    EXPECT_STREQ(gh_status_string(GH_ERR_CONFIG), "configuration error");
}
