#include <gtest/gtest.h>
#include "omr/PageAligner.hpp"
#include "SyntheticPage.hpp"

#include <opencv2/core.hpp>

using namespace omr;

namespace {

std::vector<MarkerMatch> matchesAt(const std::array<cv::Point2f, 4>& points, double confidence = 0.9) {
    std::vector<MarkerMatch> out;
    for (int i = 0; i < 4; ++i) {
        MarkerMatch m;
        m.corner = static_cast<Corner>(i);
        m.position = points[i];
        m.confidence = confidence;
        out.push_back(m);
    }
    return out;
}

cv::Point2d apply(const cv::Mat& H, const cv::Point2f& p) {
    std::vector<cv::Point2f> in{p}, out;
    cv::perspectiveTransform(in, out, H);
    return out[0];
}

}

class PageAlignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = omr_test::syntheticConfig();
    }

    OmrConfig config_;
};

TEST_F(PageAlignerTest, CanonicalMarkers_SitAnchorDistanceFromEdges) {
    PageAligner aligner(config_);
    EXPECT_EQ(aligner.canonicalSize(), cv::Size(850, 1100));

    const auto& t = aligner.canonicalMarkers();
    const float a = static_cast<float>(30.0 * 100.0 / 72.0);
    EXPECT_NEAR(t[0].x, a, 1e-3);
    EXPECT_NEAR(t[0].y, a, 1e-3);
    EXPECT_NEAR(t[2].x, 850 - a, 1e-3);
    EXPECT_NEAR(t[2].y, 1100 - a, 1e-3);
}

TEST_F(PageAlignerTest, ComputeTransform_MapsMarkersOntoTargets) {
    PageAligner aligner(config_);
    std::array<cv::Point2f, 4> raw = {{{50, 60}, {790, 40}, {810, 1070}, {30, 1050}}};
    cv::Mat H = aligner.computeTransform(matchesAt(raw));

    for (int i = 0; i < 4; ++i) {
        cv::Point2d p = apply(H, raw[i]);
        EXPECT_NEAR(p.x, aligner.canonicalMarkers()[i].x, 1e-6);
        EXPECT_NEAR(p.y, aligner.canonicalMarkers()[i].y, 1e-6);
    }
}

TEST_F(PageAlignerTest, ComputeTransform_IndependentOfMatchOrder) {
    PageAligner aligner(config_);
    std::array<cv::Point2f, 4> raw = {{{50, 60}, {790, 40}, {810, 1070}, {30, 1050}}};
    auto matches = matchesAt(raw);
    cv::Mat first = aligner.computeTransform(matches);
    std::swap(matches[0], matches[3]);
    cv::Mat second = aligner.computeTransform(matches);
    EXPECT_EQ(cv::norm(first, second, cv::NORM_INF), 0.0);
}

TEST_F(PageAlignerTest, Align_MarkersAtTargetsGiveIdentity) {
    PageAligner aligner(config_);
    cv::Mat gray(1100, 850, CV_8UC1, cv::Scalar(255));
    cv::Mat aligned;
    AlignmentResult r = aligner.align(gray, matchesAt(aligner.canonicalMarkers()), aligned);
    ASSERT_TRUE(r.ok) << r.reason;
    EXPECT_LT(cv::norm(r.homography, cv::Mat::eye(3, 3, CV_64F), cv::NORM_INF), 1e-6);
    EXPECT_EQ(aligned.size(), aligner.canonicalSize());
}

TEST_F(PageAlignerTest, Align_LowConfidenceLeavesOutputUntouched) {
    PageAligner aligner(config_);
    cv::Mat gray(1100, 850, CV_8UC1, cv::Scalar(255));
    cv::Mat aligned;
    AlignmentResult r = aligner.align(gray, matchesAt(aligner.canonicalMarkers(), 0.3), aligned);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.homography.empty());
    EXPECT_TRUE(aligned.empty());
}

TEST_F(PageAlignerTest, Align_CoincidentMarkersAreDegenerate) {
    PageAligner aligner(config_);
    cv::Mat gray(1100, 850, CV_8UC1, cv::Scalar(255));
    cv::Mat aligned;
    std::array<cv::Point2f, 4> same = {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}};
    AlignmentResult r = aligner.align(gray, matchesAt(same), aligned);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.reason, "degenerate marker geometry");
    EXPECT_TRUE(aligned.empty());
}

TEST_F(PageAlignerTest, Align_UndoesShift) {
    omr_test::SyntheticPage page(config_);
    page.drawMarkers();
    cv::Mat moved = MarkerLocator::preprocess(omr_test::shifted(page.image, 15.0, 10.0));

    MarkerLocator locator(omr_test::markerTemplate(), config_);
    PageAligner aligner(config_);
    cv::Mat aligned;
    AlignmentResult r = aligner.align(moved, locator.locate(moved), aligned);
    ASSERT_TRUE(r.ok) << r.reason;

    // Translation comes back as roughly (-15, -10)
    EXPECT_NEAR(r.homography.at<double>(0, 2), -15.0, 2.0);
    EXPECT_NEAR(r.homography.at<double>(1, 2), -10.0, 2.0);

    auto again = locator.locate(aligned);
    ASSERT_EQ(again.size(), 4u);
    for (const auto& m : again) {
        EXPECT_NEAR(m.position.x, aligner.canonicalMarkers()[static_cast<int>(m.corner)].x, 2.0);
        EXPECT_NEAR(m.position.y, aligner.canonicalMarkers()[static_cast<int>(m.corner)].y, 2.0);
    }
}
