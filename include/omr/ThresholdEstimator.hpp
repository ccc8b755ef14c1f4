#pragma once
#include <vector>

#include "omr/Config.hpp"

namespace omr {

struct ThresholdDecision {
    double threshold = 0.0;
    bool fallback = false;   // no gap wider than minGap, mean used
};

// Cutoff for one group of mutually exclusive bubbles.
// Below the threshold is filled, at or above is blank.
class ThresholdEstimator {
public:
    ThresholdEstimator(double minGap, double clamp);
    explicit ThresholdEstimator(const OmrConfig& config);

    ThresholdDecision estimate(std::vector<double> intensities) const;

    static bool isFilled(double intensity, const ThresholdDecision& decision) {
        return intensity < decision.threshold;
    }

private:
    double minGap_;
    double clamp_;
};

}
