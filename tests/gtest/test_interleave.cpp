// =============================================================================
// Bit Interleaving Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geohash/bisect.hpp"
#include "geohash/interleave.hpp"

using namespace geohash;

class InterleaveTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(InterleaveTest, AxisBitCountSplit) {
    AxisBitCounts five = AxisBitCounts::for_total(5);
    EXPECT_EQ(five.latitude, 2u);
    EXPECT_EQ(five.longitude, 3u);

    AxisBitCounts sixty = AxisBitCounts::for_precision(12);
    EXPECT_EQ(sixty.latitude, 30u);
    EXPECT_EQ(sixty.longitude, 30u);

    AxisBitCounts nine = AxisBitCounts::for_precision(9);
    EXPECT_EQ(nine.latitude, 22u);
    EXPECT_EQ(nine.longitude, 23u);
}

// Longitude occupies the even positions counted from the most significant bit
TEST_F(InterleaveTest, LongitudeLeads) {
    EXPECT_EQ(BitInterleaver::interlace(0b00, 0b111, 5), 0b10101u);
    EXPECT_EQ(BitInterleaver::interlace(0b11, 0b000, 5), 0b01010u);
    EXPECT_EQ(BitInterleaver::interlace(0, (1u << 13) - 1, 25), 0x1555555u);
}

TEST_F(InterleaveTest, SplitSeparatesAxes) {
    AxisBitsets all = BitInterleaver::split(0b11111, 5);
    EXPECT_EQ(all.latitude, 0b11u);
    EXPECT_EQ(all.longitude, 0b111u);

    AxisBitsets lon_only = BitInterleaver::split(0b10101, 5);
    EXPECT_EQ(lon_only.latitude, 0u);
    EXPECT_EQ(lon_only.longitude, 0b111u);

    AxisBitsets full = BitInterleaver::split((Bitset(1) << 60) - 1, 60);
    EXPECT_EQ(full.latitude, (Bitset(1) << 30) - 1);
    EXPECT_EQ(full.longitude, (Bitset(1) << 30) - 1);
}

// "9q8yy" is 0x9b23de; its axes are the bisection codes of the SF point
TEST_F(InterleaveTest, SanFranciscoCode) {
    AxisBitsets axes = BitInterleaver::split(0x9b23de, 25);
    EXPECT_EQ(axes.latitude, AxisBisector::encode_latitude(37.7749, 12));
    EXPECT_EQ(axes.longitude, AxisBisector::encode_longitude(-122.4194, 13));

    EXPECT_EQ(BitInterleaver::interlace(axes.latitude, axes.longitude, 25), 0x9b23deu);
}

TEST_F(InterleaveTest, FullWidthCode) {
    Bitset lat = AxisBisector::encode_latitude(37.7749, 30);
    Bitset lon = AxisBisector::encode_longitude(-122.4194, 30);
    Bitset combined = BitInterleaver::interlace(lat, lon, MAX_BITS);
    EXPECT_EQ(combined, 0x4d91ef491ecd7b7ull);

    AxisBitsets axes = BitInterleaver::split(combined, MAX_BITS);
    EXPECT_EQ(axes.latitude, lat);
    EXPECT_EQ(axes.longitude, lon);
}

TEST_F(InterleaveTest, SplitRejectsUnrepresentableWidths) {
    AxisBitsets none = BitInterleaver::split(0xFFFF, 0);
    EXPECT_EQ(none.latitude, 0u);
    EXPECT_EQ(none.longitude, 0u);

    AxisBitsets too_wide = BitInterleaver::split(0xFFFF, 65);
    EXPECT_EQ(too_wide.latitude, 0u);
    EXPECT_EQ(too_wide.longitude, 0u);
}
