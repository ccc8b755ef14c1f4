#pragma once
#include <opencv2/core.hpp>
#include <vector>

#include "omr/AnswerDecoder.hpp"
#include "omr/BubbleLayout.hpp"
#include "omr/Config.hpp"
#include "omr/CoordinateMapper.hpp"

namespace omr {

// Diagnostic view of one aligned page: marked boxes red, blank grey, separators green.
class OverlayRenderer {
public:
    OverlayRenderer(const BubbleLayout& layout, const OmrConfig& config);

    cv::Mat render(const cv::Mat& alignedGray, const std::vector<GroupEvaluation>& groups) const;

private:
    const BubbleLayout& layout_;
    CoordinateMapper mapper_;
    double bubbleRadius_;
    double topCrop_;
};

}
