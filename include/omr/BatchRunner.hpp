#pragma once
#include <atomic>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "omr/AnswerAssembler.hpp"
#include "omr/BubbleLayout.hpp"
#include "omr/Config.hpp"
#include "omr/PageProcessor.hpp"

namespace omr {

// Walks <input>/<page>/<student>_<page>[_<suffix>].{png,jpg,jpeg}, sorted by path.
// Images are not loaded here.
std::vector<RawPage> discoverPages(const std::string& inputDir);

// Splits "<student>_<page>[_<suffix>]". False when the stem does not follow it.
bool parsePageStem(const std::string& stem, std::string& studentId, int& page, bool& replacement);

struct BatchReport {
    size_t discovered = 0;
    size_t processed = 0;
    size_t skipped = 0;   // cancelled before they started
    size_t failed = 0;    // pages that contributed no cells

    std::vector<PageResult> results;     // processed pages, sorted by path
    std::vector<PageFailure> failures;
    AnswerAssembler answers;
};

class BatchRunner {
public:
    BatchRunner(const BubbleLayout& layout, const cv::Mat& markerTemplate, const OmrConfig& config);

    // Decodes in parallel, then merges on the calling thread.
    // `cancel` is polled before each page starts; in-flight pages finish.
    BatchReport run(const std::vector<RawPage>& pages, const std::atomic<bool>* cancel = nullptr) const;

private:
    void reportMissingPages(const std::vector<RawPage>& pages, BatchReport& report) const;

    const BubbleLayout& layout_;
    OmrConfig config_;
    PageProcessor processor_;
};

}
