#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "omr/AnswerDecoder.hpp"
#include "omr/BubbleLayout.hpp"
#include "omr/BubbleSampler.hpp"
#include "omr/Config.hpp"
#include "omr/Errors.hpp"
#include "omr/MarkerLocator.hpp"
#include "omr/OverlayRenderer.hpp"
#include "omr/PageAligner.hpp"
#include "omr/ThresholdEstimator.hpp"

namespace omr {

struct RawPage {
    std::string path;
    std::string studentId;
    int page = 0;
    bool replacement = false;
    cv::Mat image;   // loaded from `path` when empty
};

struct PageResult {
    std::string source;
    std::string studentId;
    int page = 0;
    bool replacement = false;

    AlignmentResult alignment;
    std::vector<GroupEvaluation> groups;
    std::vector<DecodedAnswer> answers;
    std::vector<PageFailure> failures;
    cv::Mat overlay;   // only when overlays are enabled and alignment succeeded

    // Failed pages contribute no cells.
    bool usable() const { return alignment.ok; }
};

// One page from pixels to answers. Never throws for page-level problems;
// every one becomes a PageFailure. Safe to call concurrently.
class PageProcessor {
public:
    PageProcessor(const BubbleLayout& layout, const cv::Mat& markerTemplate, const OmrConfig& config);

    PageResult process(const RawPage& page) const;

private:
    std::vector<GroupEvaluation> evaluateGroups(const cv::Mat& aligned, int page) const;

    const BubbleLayout& layout_;
    OmrConfig config_;
    MarkerLocator locator_;
    PageAligner aligner_;
    BubbleSampler sampler_;
    ThresholdEstimator estimator_;
    AnswerDecoder decoder_;
    OverlayRenderer overlay_;
};

}
