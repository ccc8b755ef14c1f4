#include "omr/PageProcessor.hpp"

#include <opencv2/imgcodecs.hpp>
#include <map>

#include <spdlog/spdlog.h>

using namespace cv;

namespace omr {

namespace {

PageFailure failureFor(const RawPage& page, FailureReason reason, const std::string& detail) {
    PageFailure f;
    f.studentId = page.studentId;
    f.page = page.page;
    f.reason = reason;
    f.detail = detail;
    f.source = page.path;
    return f;
}

}

PageProcessor::PageProcessor(const BubbleLayout& layout, const Mat& markerTemplate, const OmrConfig& config)
    : layout_(layout),
      config_(config),
      locator_(markerTemplate, config),
      aligner_(config),
      sampler_(CoordinateMapper::forCanonicalPage(config), config.bubbleRadius),
      estimator_(config),
      decoder_(layout),
      overlay_(layout, config) {}

std::vector<GroupEvaluation> PageProcessor::evaluateGroups(const Mat& aligned, int page) const {
    std::vector<GroupEvaluation> out;
    for (size_t gi : layout_.groupsOnPage(page)) {
        const BubbleGroup& group = layout_.group(gi);
        GroupEvaluation E;
        E.group = gi;
        E.separator = group.separatorOnly;
        if (E.separator) {
            out.push_back(E);
            continue;
        }

        std::vector<double> intensities;
        for (size_t idx : group.members) {
            BubbleReading r = sampler_.read(aligned, layout_.definitions()[idx]);
            intensities.push_back(r.intensity);
            E.readings.push_back(r);
        }
        E.threshold = estimator_.estimate(intensities);
        for (const auto& r : E.readings)
            E.filled.push_back(ThresholdEstimator::isFilled(r.intensity, E.threshold));

        spdlog::trace("{} threshold {:.1f}{}", group.key.describe(), E.threshold.threshold,
                      E.threshold.fallback ? " (fallback)" : "");
        out.push_back(std::move(E));
    }
    return out;
}

PageResult PageProcessor::process(const RawPage& page) const {
    PageResult R;
    R.source = page.path;
    R.studentId = page.studentId;
    R.page = page.page;
    R.replacement = page.replacement;

    if (!layout_.hasPage(page.page)) {
        R.failures.push_back(failureFor(page, FailureReason::MissingLayoutEntry,
                                        "no bubble definitions for page " + std::to_string(page.page)));
        return R;
    }

    Mat gray;
    try {
        gray = page.image.empty() ? imread(page.path, IMREAD_GRAYSCALE) : page.image;
        if (!gray.empty()) gray = MarkerLocator::preprocess(gray);
    } catch (const cv::Exception& e) {
        R.failures.push_back(failureFor(page, FailureReason::UnreadableImage, e.what()));
        return R;
    }
    if (gray.empty()) {
        R.failures.push_back(failureFor(page, FailureReason::UnreadableImage, "cannot decode image"));
        return R;
    }

    Mat aligned;
    R.alignment = aligner_.align(gray, locator_.locate(gray), aligned);
    if (!R.alignment.ok) {
        spdlog::debug("{}: alignment failed, {}", page.path, R.alignment.reason);
        R.failures.push_back(failureFor(page, FailureReason::AlignmentFailed, R.alignment.reason));
        return R;
    }

    R.groups = evaluateGroups(aligned, page.page);

    std::map<size_t, std::vector<std::string>> filledByGroup;
    for (const auto& g : R.groups)
        if (!g.separator) filledByGroup[g.group] = g.filledLabels();

    for (const auto& sub : layout_.subquestions(page.page)) {
        DecodedAnswer a = decoder_.decode(page.studentId, sub, filledByGroup);
        if (a.ambiguous)
            R.failures.push_back(failureFor(page, FailureReason::AmbiguousBubble,
                                            a.column() + " has more than one mark"));
        R.answers.push_back(std::move(a));
    }

    if (config_.writeOverlays) R.overlay = overlay_.render(aligned, R.groups);

    spdlog::debug("{}: {} answers, marker confidence {:.3f}", page.path, R.answers.size(),
                  R.alignment.confidence);
    return R;
}

}
