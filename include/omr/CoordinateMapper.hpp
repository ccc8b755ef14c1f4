#pragma once
#include <opencv2/core.hpp>

namespace omr {

struct OmrConfig;

constexpr double kDesignUnitsPerInch = 72.0;

// Design frame: origin bottom-left, 1/72 inch units.
// Pixel frame: origin top-left of an image `height` pixels tall at `dpi`.
class CoordinateMapper {
public:
    CoordinateMapper(double dpi, int imageHeight);

    static CoordinateMapper forCanonicalPage(const OmrConfig& config);

    cv::Point2d toPixel(double xDesign, double yDesign) const;
    cv::Point2d toDesign(const cv::Point2d& pixel) const;
    double toPixels(double designLength) const;

    double dpi() const { return dpi_; }
    int imageHeight() const { return height_; }

private:
    double dpi_;
    int height_;
};

}
