#include <gtest/gtest.h>
#include "omr/Config.hpp"
#include "omr/CoordinateMapper.hpp"

using namespace omr;

TEST(CoordinateMapperTest, OriginIsBottomLeft) {
    CoordinateMapper m(72.0, 792);
    cv::Point2d p = m.toPixel(0.0, 0.0);
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 792.0);

    p = m.toPixel(612.0, 792.0);
    EXPECT_DOUBLE_EQ(p.x, 612.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

TEST(CoordinateMapperTest, ScalesWithDpi) {
    CoordinateMapper m(200.0, 2200);
    EXPECT_DOUBLE_EQ(m.toPixels(72.0), 200.0);
    cv::Point2d p = m.toPixel(36.0, 72.0);
    EXPECT_DOUBLE_EQ(p.x, 100.0);
    EXPECT_DOUBLE_EQ(p.y, 2000.0);
}

TEST(CoordinateMapperTest, ToDesign_InvertsToPixel) {
    CoordinateMapper m(150.0, 1650);
    cv::Point2d design = m.toDesign(m.toPixel(123.5, 456.25));
    EXPECT_NEAR(design.x, 123.5, 1e-9);
    EXPECT_NEAR(design.y, 456.25, 1e-9);
}

TEST(CoordinateMapperTest, ForCanonicalPage_UsesConfiguredDpi) {
    OmrConfig c;
    CoordinateMapper m = CoordinateMapper::forCanonicalPage(c);
    EXPECT_DOUBLE_EQ(m.dpi(), 200.0);
    EXPECT_EQ(m.imageHeight(), 2200);
}
