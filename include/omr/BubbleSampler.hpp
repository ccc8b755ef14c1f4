#pragma once
#include <opencv2/core.hpp>

#include "omr/BubbleLayout.hpp"
#include "omr/CoordinateMapper.hpp"

namespace omr {

struct BubbleReading {
    const BubbleDefinition* definition = nullptr;
    cv::Rect region;            // sampled square, canonical pixels
    double intensity = 255.0;   // mean gray, 0 = black
};

class BubbleSampler {
public:
    BubbleSampler(const CoordinateMapper& mapper, double bubbleRadius);

    // Largest axis-aligned square inside the printed circle, clipped to the image.
    cv::Rect sampleRect(const BubbleDefinition& bubble, const cv::Size& imageSize) const;

    // Mean intensity of `rect`; an empty region reads as blank paper.
    static double meanIntensity(const cv::Mat& gray, const cv::Rect& rect);

    BubbleReading read(const cv::Mat& alignedGray, const BubbleDefinition& bubble) const;

private:
    CoordinateMapper mapper_;
    double halfSide_;   // design units
};

}
