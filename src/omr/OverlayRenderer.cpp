#include "omr/OverlayRenderer.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

using namespace cv;

namespace omr {

OverlayRenderer::OverlayRenderer(const BubbleLayout& layout, const OmrConfig& config)
    : layout_(layout),
      mapper_(CoordinateMapper::forCanonicalPage(config)),
      bubbleRadius_(config.bubbleRadius),
      topCrop_(config.overlayTopCrop) {}

Mat OverlayRenderer::render(const Mat& alignedGray, const std::vector<GroupEvaluation>& groups) const {
    Mat vis;
    if (alignedGray.channels() == 1) cvtColor(alignedGray, vis, COLOR_GRAY2BGR);
    else vis = alignedGray.clone();

    const int radiusPx = std::max(1, static_cast<int>(std::lround(mapper_.toPixels(bubbleRadius_))));

    for (const auto& g : groups) {
        if (g.separator) {
            for (size_t idx : layout_.group(g.group).members) {
                const BubbleDefinition& d = layout_.definitions()[idx];
                const Point2d c = mapper_.toPixel(d.xDesign, d.yDesign);
                circle(vis, Point(cvRound(c.x), cvRound(c.y)), radiusPx, Scalar(0, 200, 0), 1, LINE_AA);
            }
            continue;
        }
        for (size_t i = 0; i < g.readings.size(); ++i) {
            const BubbleReading& r = g.readings[i];
            const bool marked = i < g.filled.size() && g.filled[i];
            if (marked) {
                rectangle(vis, r.region, Scalar(0, 0, 255), 2);
                putText(vis, std::to_string(static_cast<int>(r.intensity)),
                        Point(r.region.x, r.region.y - 3),
                        FONT_HERSHEY_SIMPLEX, 0.35, Scalar(0, 0, 255), 1);
            } else {
                rectangle(vis, r.region, Scalar(120, 120, 120), 1);
            }
        }
    }

    const int top = std::clamp(static_cast<int>(vis.rows * topCrop_), 0, std::max(0, vis.rows - 1));
    return vis(Rect(0, top, vis.cols, vis.rows - top)).clone();
}

}
