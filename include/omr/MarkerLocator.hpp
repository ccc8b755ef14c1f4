#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

#include "omr/Config.hpp"

namespace omr {

enum class Corner { TopLeft = 0, TopRight = 1, BottomRight = 2, BottomLeft = 3 };

const char* toString(Corner corner);

struct MarkerMatch {
    Corner corner = Corner::TopLeft;
    cv::Point2f position;      // marker centre, raw image pixels
    double confidence = 0.0;   // normalized correlation clamped to [0,1]
};

struct AlignmentResult {
    bool ok = false;
    cv::Mat homography;                  // 3x3 CV_64F raw -> canonical, only when ok
    std::vector<MarkerMatch> markers;
    double confidence = 0.0;             // weakest corner
    std::string reason;                  // why the page was rejected
};

// Loads the grayscale marker template; throws TemplateException.
cv::Mat loadMarkerTemplate(const std::string& path);

class MarkerLocator {
public:
    MarkerLocator(const cv::Mat& markerTemplate, const OmrConfig& config);

    // Blur + min-max stretch applied to pages and template alike.
    static cv::Mat preprocess(const cv::Mat& gray);

    // One match per corner region the template fits in, TL, TR, BR, BL order.
    std::vector<MarkerMatch> locate(const cv::Mat& pageGray) const;

    // Hard gate: four corners, every confidence >= gate. Leaves homography empty.
    static AlignmentResult evaluate(const std::vector<MarkerMatch>& matches, double gate);

    std::array<cv::Rect, 4> cornerRegions(const cv::Size& pageSize) const;
    cv::Mat scaledTemplate(const cv::Size& pageSize) const;

private:
    cv::Mat template_;
    OmrConfig config_;
};

}
