#include "omr/PageAligner.hpp"
#include "omr/CoordinateMapper.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>

using namespace cv;

namespace omr {

PageAligner::PageAligner(const OmrConfig& config)
    : config_(config), size_(config.canonicalSize()) {
    const CoordinateMapper mapper = CoordinateMapper::forCanonicalPage(config);
    const double a = config.anchorDistance;
    const double w = config.pageWidth;
    const double h = config.pageHeight;

    const Point2d tl = mapper.toPixel(a, h - a);
    const Point2d tr = mapper.toPixel(w - a, h - a);
    const Point2d br = mapper.toPixel(w - a, a);
    const Point2d bl = mapper.toPixel(a, a);
    target_ = {{Point2f(tl), Point2f(tr), Point2f(br), Point2f(bl)}};
}

Mat PageAligner::computeTransform(const std::vector<MarkerMatch>& markers) const {
    CV_Assert(markers.size() == 4);

    Point2f src[4];
    Point2f dst[4];
    for (const auto& m : markers) {
        const int i = static_cast<int>(m.corner);
        src[i] = m.position;
        dst[i] = target_[i];
    }
    return getPerspectiveTransform(src, dst);
}

Mat PageAligner::warp(const Mat& pageGray, const Mat& homography) const {
    Mat out;
    warpPerspective(pageGray, out, homography, size_, INTER_LINEAR, BORDER_REPLICATE);
    return out;
}

AlignmentResult PageAligner::align(const Mat& pageGray,
                                   const std::vector<MarkerMatch>& markers,
                                   Mat& aligned) const {
    AlignmentResult R = MarkerLocator::evaluate(markers, config_.markerConfidenceGate);
    if (!R.ok) return R;

    R.homography = computeTransform(markers);
    if (R.homography.empty() || !checkRange(R.homography) ||
        std::abs(determinant(R.homography)) < 1e-9) {
        R.ok = false;
        R.homography.release();
        R.reason = "degenerate marker geometry";
        return R;
    }

    aligned = warp(pageGray, R.homography);
    return R;
}

}
