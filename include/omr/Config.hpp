#pragma once
#include <opencv2/core.hpp>
#include <string>

namespace omr {

// All lengths are design units (1/72 inch) unless the name says otherwise.
struct OmrConfig {
    double markerConfidenceGate = 0.6;   // hard gate per corner marker
    double thresholdClamp = 210.0;       // a group threshold never exceeds this
    double minGap = 25.0;                // gaps at or below this are "no separation"

    double bubbleRadius = 7.0;
    double anchorRadius = 10.0;
    double anchorDistance = 30.0;        // marker centre to page edge

    double pageWidth = 612.0;            // US Letter
    double pageHeight = 792.0;
    double canonicalDpi = 200.0;

    int workers = 0;                     // 0 = one per core
    bool writeOverlays = false;
    double overlayTopCrop = 0.09;
    std::string logLevel = "info";

    cv::Size canonicalSize() const;
};

// Starts from the defaults and overrides every key present in the file.
// Accepts anything cv::FileStorage reads (YAML, JSON, XML).
OmrConfig loadConfig(const std::string& path);

void validateConfig(const OmrConfig& config);

}
