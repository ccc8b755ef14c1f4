#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <vector>

#include "omr/Config.hpp"
#include "omr/MarkerLocator.hpp"

namespace omr {

class PageAligner {
public:
    explicit PageAligner(const OmrConfig& config);

    cv::Size canonicalSize() const { return size_; }

    // Where the marker centres sit on the canonical page, TL, TR, BR, BL.
    const std::array<cv::Point2f, 4>& canonicalMarkers() const { return target_; }

    // Closed-form four-point homography; identical inputs give identical matrices.
    cv::Mat computeTransform(const std::vector<MarkerMatch>& markers) const;

    cv::Mat warp(const cv::Mat& pageGray, const cv::Mat& homography) const;

    // Gate, transform and warp. `aligned` is only written when the result is ok.
    AlignmentResult align(const cv::Mat& pageGray,
                          const std::vector<MarkerMatch>& markers,
                          cv::Mat& aligned) const;

private:
    OmrConfig config_;
    cv::Size size_;
    std::array<cv::Point2f, 4> target_;
};

}
