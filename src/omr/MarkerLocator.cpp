#include "omr/MarkerLocator.hpp"
#include "omr/CoordinateMapper.hpp"
#include "omr/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace cv;

namespace omr {

const char* toString(Corner corner) {
    switch (corner) {
        case Corner::TopLeft:     return "TL";
        case Corner::TopRight:    return "TR";
        case Corner::BottomRight: return "BR";
        case Corner::BottomLeft:  return "BL";
    }
    return "?";
}

Mat loadMarkerTemplate(const std::string& path) {
    Mat img;
    try {
        img = imread(path, IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        throw TemplateException("cannot decode " + path + ": " + e.what());
    }
    if (img.empty()) throw TemplateException("cannot read " + path);
    if (img.cols < 3 || img.rows < 3) throw TemplateException(path + " is too small");
    return img;
}

MarkerLocator::MarkerLocator(const Mat& markerTemplate, const OmrConfig& config)
    : template_(markerTemplate), config_(config) {
    if (template_.empty()) throw TemplateException("empty marker template");
    if (template_.channels() != 1) cvtColor(markerTemplate, template_, COLOR_BGR2GRAY);
}

Mat MarkerLocator::preprocess(const Mat& gray) {
    Mat src = gray;
    if (gray.channels() == 3) cvtColor(gray, src, COLOR_BGR2GRAY);

    Mat blurred, out;
    GaussianBlur(src, blurred, Size(3, 3), 0);
    normalize(blurred, out, 0, 255, NORM_MINMAX, CV_8U);
    return out;
}

std::array<Rect, 4> MarkerLocator::cornerRegions(const Size& pageSize) const {
    // Search only near the corners; a quarter of the page width in from each edge.
    const int side = pageSize.width / 4;
    const int w = std::min(side, pageSize.width);
    const int h = std::min(side, pageSize.height);
    return {{
        Rect(0, 0, w, h),
        Rect(pageSize.width - w, 0, w, h),
        Rect(pageSize.width - w, pageSize.height - h, w, h),
        Rect(0, pageSize.height - h, w, h)
    }};
}

Mat MarkerLocator::scaledTemplate(const Size& pageSize) const {
    // Raw scans carry no reliable density; assume the scan spans the page width.
    const double rawDpi = pageSize.width / (config_.pageWidth / kDesignUnitsPerInch);
    const double diameter = 2.0 * config_.anchorRadius * rawDpi / kDesignUnitsPerInch;
    const int side = std::max(3, static_cast<int>(std::lround(diameter)));

    Mat resized;
    const int interp = side < template_.cols ? INTER_AREA : INTER_LINEAR;
    resize(template_, resized, Size(side, side), 0, 0, interp);
    return preprocess(resized);
}

std::vector<MarkerMatch> MarkerLocator::locate(const Mat& pageGray) const {
    std::vector<MarkerMatch> matches;
    if (pageGray.empty()) return matches;

    const Mat tmpl = scaledTemplate(pageGray.size());
    const auto regions = cornerRegions(pageGray.size());
    const Point2f centre((tmpl.cols - 1) / 2.f, (tmpl.rows - 1) / 2.f);

    for (int i = 0; i < 4; ++i) {
        const Rect& r = regions[i];
        if (r.width < tmpl.cols || r.height < tmpl.rows) continue;

        Mat response;
        matchTemplate(pageGray(r), tmpl, response, TM_CCOEFF_NORMED);

        double best = 0.0;
        Point loc;
        minMaxLoc(response, nullptr, &best, nullptr, &loc);
        if (!std::isfinite(best)) best = 0.0;

        MarkerMatch m;
        m.corner = static_cast<Corner>(i);
        m.position = Point2f(static_cast<float>(r.x + loc.x), static_cast<float>(r.y + loc.y)) + centre;
        m.confidence = std::min(1.0, std::max(0.0, best));
        matches.push_back(m);
    }
    return matches;
}

AlignmentResult MarkerLocator::evaluate(const std::vector<MarkerMatch>& matches, double gate) {
    AlignmentResult R;
    R.markers = matches;

    bool seen[4] = {false, false, false, false};
    for (const auto& m : matches) seen[static_cast<int>(m.corner)] = true;

    std::ostringstream why;
    const int found = static_cast<int>(std::count(seen, seen + 4, true));
    if (found < 4) {
        why << "only " << found << " of 4 markers found (missing";
        for (int i = 0; i < 4; ++i)
            if (!seen[i]) why << " " << toString(static_cast<Corner>(i));
        why << ")";
        R.reason = why.str();
        return R;
    }

    R.confidence = 1.0;
    for (const auto& m : matches) {
        R.confidence = std::min(R.confidence, m.confidence);
        if (m.confidence < gate) {
            why << std::fixed << std::setprecision(3)
                << "marker " << toString(m.corner) << " confidence " << m.confidence
                << " below gate " << gate;
            R.reason = why.str();
            return R;
        }
    }

    R.ok = true;
    return R;
}

}
