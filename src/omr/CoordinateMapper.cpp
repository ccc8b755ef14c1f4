#include "omr/CoordinateMapper.hpp"
#include "omr/Config.hpp"

namespace omr {

CoordinateMapper::CoordinateMapper(double dpi, int imageHeight)
    : dpi_(dpi), height_(imageHeight) {}

CoordinateMapper CoordinateMapper::forCanonicalPage(const OmrConfig& config) {
    return CoordinateMapper(config.canonicalDpi, config.canonicalSize().height);
}

cv::Point2d CoordinateMapper::toPixel(double xDesign, double yDesign) const {
    return cv::Point2d(toPixels(xDesign), height_ - toPixels(yDesign));
}

cv::Point2d CoordinateMapper::toDesign(const cv::Point2d& pixel) const {
    const double scale = kDesignUnitsPerInch / dpi_;
    return cv::Point2d(pixel.x * scale, (height_ - pixel.y) * scale);
}

double CoordinateMapper::toPixels(double designLength) const {
    return designLength * dpi_ / kDesignUnitsPerInch;
}

}
