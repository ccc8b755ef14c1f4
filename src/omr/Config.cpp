#include "omr/Config.hpp"
#include "omr/CoordinateMapper.hpp"
#include "omr/Errors.hpp"

#include <opencv2/core/persistence.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace omr {

namespace {

void readNumber(const cv::FileNode& root, const char* key, double& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isReal() && !n.isInt())
        throw ConfigException(std::string(key) + " must be a number");
    out = static_cast<double>(n);
}

void readInt(const cv::FileNode& root, const char* key, int& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isInt())
        throw ConfigException(std::string(key) + " must be an integer");
    out = static_cast<int>(n);
}

void readFlag(const cv::FileNode& root, const char* key, bool& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (n.isInt()) {
        out = static_cast<int>(n) != 0;
        return;
    }
    if (n.isString()) {
        std::string s = static_cast<std::string>(n);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "true" || s == "yes" || s == "on") { out = true; return; }
        if (s == "false" || s == "no" || s == "off") { out = false; return; }
    }
    throw ConfigException(std::string(key) + " must be a boolean (0/1, true/false)");
}

void readString(const cv::FileNode& root, const char* key, std::string& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isString())
        throw ConfigException(std::string(key) + " must be a string");
    out = static_cast<std::string>(n);
}

}

cv::Size OmrConfig::canonicalSize() const {
    const double scale = canonicalDpi / kDesignUnitsPerInch;
    return cv::Size(static_cast<int>(std::lround(pageWidth * scale)),
                    static_cast<int>(std::lround(pageHeight * scale)));
}

OmrConfig loadConfig(const std::string& path) {
    OmrConfig cfg;

    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw ConfigException("cannot parse " + path + ": " + e.what());
    }
    if (!fs.isOpened())
        throw ConfigException("cannot open " + path);

    const cv::FileNode root = fs.root();
    readNumber(root, "marker_confidence_gate", cfg.markerConfidenceGate);
    readNumber(root, "threshold_clamp", cfg.thresholdClamp);
    readNumber(root, "min_gap", cfg.minGap);
    readNumber(root, "bubble_radius", cfg.bubbleRadius);
    readNumber(root, "anchor_radius", cfg.anchorRadius);
    readNumber(root, "anchor_distance", cfg.anchorDistance);
    readNumber(root, "page_width", cfg.pageWidth);
    readNumber(root, "page_height", cfg.pageHeight);
    readNumber(root, "canonical_dpi", cfg.canonicalDpi);
    readInt(root, "workers", cfg.workers);
    readFlag(root, "write_overlays", cfg.writeOverlays);
    readNumber(root, "overlay_top_crop", cfg.overlayTopCrop);
    readString(root, "log_level", cfg.logLevel);

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const OmrConfig& c) {
    if (!(c.markerConfidenceGate > 0.0 && c.markerConfidenceGate <= 1.0))
        throw ConfigException("marker_confidence_gate must be in (0, 1]");
    if (!(c.thresholdClamp > 0.0 && c.thresholdClamp <= 255.0))
        throw ConfigException("threshold_clamp must be in (0, 255]");
    if (c.minGap < 0.0)
        throw ConfigException("min_gap must not be negative");
    if (c.bubbleRadius <= 0.0 || c.anchorRadius <= 0.0)
        throw ConfigException("bubble_radius and anchor_radius must be positive");
    if (c.pageWidth <= 0.0 || c.pageHeight <= 0.0)
        throw ConfigException("page size must be positive");
    if (c.anchorDistance <= 0.0 ||
        2.0 * c.anchorDistance >= std::min(c.pageWidth, c.pageHeight))
        throw ConfigException("anchor_distance must place the markers inside the page");
    if (c.canonicalDpi < 10.0)
        throw ConfigException("canonical_dpi is too small");
    if (c.workers < 0)
        throw ConfigException("workers must be >= 0");
    if (c.overlayTopCrop < 0.0 || c.overlayTopCrop >= 1.0)
        throw ConfigException("overlay_top_crop must be in [0, 1)");
}

}
