#include "omr/BubbleSampler.hpp"

#include <algorithm>
#include <cmath>

using namespace cv;

namespace omr {

BubbleSampler::BubbleSampler(const CoordinateMapper& mapper, double bubbleRadius)
    : mapper_(mapper), halfSide_(bubbleRadius / std::sqrt(2.0)) {}

Rect BubbleSampler::sampleRect(const BubbleDefinition& bubble, const Size& imageSize) const {
    // Design y grows upwards, so the square's top edge comes from y + half.
    const Point2d topLeft = mapper_.toPixel(bubble.xDesign - halfSide_, bubble.yDesign + halfSide_);
    const Point2d bottomRight = mapper_.toPixel(bubble.xDesign + halfSide_, bubble.yDesign - halfSide_);

    const int left = static_cast<int>(std::floor(topLeft.x));
    const int top = static_cast<int>(std::floor(topLeft.y));
    const int right = static_cast<int>(std::floor(bottomRight.x));
    const int bottom = static_cast<int>(std::floor(bottomRight.y));

    Rect r(left, top, std::max(0, right - left), std::max(0, bottom - top));
    return r & Rect(0, 0, imageSize.width, imageSize.height);
}

double BubbleSampler::meanIntensity(const Mat& gray, const Rect& rect) {
    if (rect.width <= 0 || rect.height <= 0) return 255.0;
    return mean(gray(rect))[0];
}

BubbleReading BubbleSampler::read(const Mat& alignedGray, const BubbleDefinition& bubble) const {
    BubbleReading r;
    r.definition = &bubble;
    r.region = sampleRect(bubble, alignedGray.size());
    r.intensity = meanIntensity(alignedGray, r.region);
    return r;
}

}
