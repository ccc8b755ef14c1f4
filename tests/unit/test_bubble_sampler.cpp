#include <gtest/gtest.h>
#include "omr/BubbleSampler.hpp"

#include <opencv2/imgproc.hpp>

using namespace omr;

namespace {

BubbleDefinition bubbleAt(double x, double y) {
    return makeBubbleDefinition(1, "1", "a", "A", x, y);
}

}

TEST(BubbleSamplerTest, SampleRect_IsInscribedSquare) {
    // 72 dpi: one design unit per pixel
    BubbleSampler sampler(CoordinateMapper(72.0, 100), 7.0);
    cv::Rect r = sampler.sampleRect(bubbleAt(50.0, 50.0), cv::Size(100, 100));
    EXPECT_EQ(r, cv::Rect(45, 45, 9, 9));
}

TEST(BubbleSamplerTest, SampleRect_FollowsDesignYUpwards) {
    BubbleSampler sampler(CoordinateMapper(72.0, 100), 7.0);
    cv::Rect low = sampler.sampleRect(bubbleAt(50.0, 20.0), cv::Size(100, 100));
    cv::Rect high = sampler.sampleRect(bubbleAt(50.0, 80.0), cv::Size(100, 100));
    EXPECT_GT(low.y, high.y);
}

TEST(BubbleSamplerTest, SampleRect_ClippedToImage) {
    BubbleSampler sampler(CoordinateMapper(72.0, 100), 7.0);
    cv::Rect r = sampler.sampleRect(bubbleAt(2.0, 50.0), cv::Size(100, 100));
    EXPECT_EQ(r.x, 0);
    EXPECT_LT(r.width, 9);

    cv::Rect outside = sampler.sampleRect(bubbleAt(500.0, 50.0), cv::Size(100, 100));
    EXPECT_TRUE(outside.empty());
}

TEST(BubbleSamplerTest, MeanIntensity_EmptyRegionReadsBlank) {
    cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(0));
    EXPECT_DOUBLE_EQ(BubbleSampler::meanIntensity(gray, cv::Rect()), 255.0);
}

TEST(BubbleSamplerTest, Read_DarkBubbleIsDark) {
    cv::Mat gray(100, 100, CV_8UC1, cv::Scalar(255));
    cv::circle(gray, cv::Point(50, 50), 7, cv::Scalar(0), cv::FILLED);

    BubbleSampler sampler(CoordinateMapper(72.0, 100), 7.0);
    BubbleDefinition filled = bubbleAt(50.0, 50.0);
    BubbleDefinition blank = bubbleAt(20.0, 20.0);

    BubbleReading a = sampler.read(gray, filled);
    BubbleReading b = sampler.read(gray, blank);
    EXPECT_EQ(a.definition, &filled);
    EXPECT_LT(a.intensity, 40.0);
    EXPECT_DOUBLE_EQ(b.intensity, 255.0);
}
