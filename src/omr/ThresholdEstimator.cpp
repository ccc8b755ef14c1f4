#include "omr/ThresholdEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace omr {

ThresholdEstimator::ThresholdEstimator(double minGap, double clamp)
    : minGap_(minGap), clamp_(clamp) {}

ThresholdEstimator::ThresholdEstimator(const OmrConfig& config)
    : ThresholdEstimator(config.minGap, config.thresholdClamp) {}

ThresholdDecision ThresholdEstimator::estimate(std::vector<double> v) const {
    ThresholdDecision D;

    // A lone bubble has nothing to be compared against.
    if (v.size() < 2) {
        D.threshold = clamp_;
        D.fallback = true;
        return D;
    }

    std::sort(v.begin(), v.end());

    double largest = 0.0;
    for (size_t i = 1; i < v.size(); ++i) largest = std::max(largest, v[i] - v[i - 1]);

    if (largest <= minGap_) {
        D.threshold = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
        D.fallback = true;
    } else {
        // Equal largest gaps: take the one centred nearest the middle of the range,
        // the lower one if still tied.
        const double middle = (v.front() + v.back()) / 2.0;
        double bestDistance = 0.0;
        bool have = false;
        for (size_t i = 1; i < v.size(); ++i) {
            if (std::abs((v[i] - v[i - 1]) - largest) > 1e-9) continue;
            const double mid = (v[i] + v[i - 1]) / 2.0;
            const double distance = std::abs(mid - middle);
            if (!have || distance < bestDistance - 1e-9) {
                have = true;
                bestDistance = distance;
                D.threshold = mid;
            }
        }
    }

    D.threshold = std::min(D.threshold, clamp_);
    return D;
}

}
