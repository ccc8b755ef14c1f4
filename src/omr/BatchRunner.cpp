#include "omr/BatchRunner.hpp"
#include "omr/WorkerPool.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <set>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace omr {

namespace {

bool isImage(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

bool isNumber(const std::string& s) {
    return !s.empty() && s.size() < 9 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

}

bool parsePageStem(const std::string& stem, std::string& studentId, int& page, bool& replacement) {
    const auto first = stem.find('_');
    if (first == std::string::npos || first == 0) return false;

    const auto second = stem.find('_', first + 1);
    const std::string pageText = stem.substr(first + 1, second == std::string::npos
                                                            ? std::string::npos
                                                            : second - first - 1);
    if (!isNumber(pageText)) return false;

    studentId = stem.substr(0, first);
    page = std::stoi(pageText);
    replacement = second != std::string::npos && stem.substr(second + 1) == "replacement";
    return true;
}

std::vector<RawPage> discoverPages(const std::string& inputDir) {
    std::vector<RawPage> pages;
    if (!fs::is_directory(inputDir)) throw Exception("input directory not found: " + inputDir);

    for (const auto& dir : fs::directory_iterator(inputDir)) {
        if (!dir.is_directory()) continue;
        const std::string name = dir.path().filename().string();
        if (!isNumber(name)) {
            spdlog::warn("Skipping folder {} (not a page number)", dir.path().string());
            continue;
        }
        const int folderPage = std::stoi(name);

        for (const auto& file : fs::directory_iterator(dir.path())) {
            if (!file.is_regular_file() || !isImage(file.path())) continue;

            RawPage p;
            p.path = file.path().string();
            if (!parsePageStem(file.path().stem().string(), p.studentId, p.page, p.replacement)) {
                spdlog::warn("Skipping {} (expected <student>_<page>[_<suffix>])", p.path);
                continue;
            }
            if (p.page != folderPage) {
                spdlog::warn("{} names page {} but sits in folder {}; using the folder", p.path,
                             p.page, folderPage);
                p.page = folderPage;
            }
            pages.push_back(std::move(p));
        }
    }

    std::sort(pages.begin(), pages.end(),
              [](const RawPage& a, const RawPage& b) { return a.path < b.path; });
    return pages;
}

BatchRunner::BatchRunner(const BubbleLayout& layout, const cv::Mat& markerTemplate, const OmrConfig& config)
    : layout_(layout), config_(config), processor_(layout, markerTemplate, config) {}

BatchReport BatchRunner::run(const std::vector<RawPage>& pages, const std::atomic<bool>* cancel) const {
    BatchReport report;
    report.discovered = pages.size();

    // One slot per page; each worker writes only its own.
    std::vector<std::optional<PageResult>> slots(pages.size());
    {
        WorkerPool pool(static_cast<size_t>(config_.workers));
        spdlog::info("Decoding {} pages on {} workers", pages.size(), pool.size());

        for (size_t i = 0; i < pages.size(); ++i) {
            pool.execute([this, &pages, &slots, cancel, i] {
                if (cancel && cancel->load()) return;
                try {
                    slots[i] = processor_.process(pages[i]);
                } catch (const std::exception& e) {
                    PageResult r;
                    r.source = pages[i].path;
                    r.studentId = pages[i].studentId;
                    r.page = pages[i].page;
                    r.replacement = pages[i].replacement;
                    PageFailure f;
                    f.studentId = r.studentId;
                    f.page = r.page;
                    f.reason = FailureReason::UnreadableImage;
                    f.detail = e.what();
                    f.source = r.source;
                    r.failures.push_back(f);
                    slots[i] = std::move(r);
                }
            });
        }
        pool.waitAll();
    }

    std::vector<size_t> order;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
            ++report.skipped;
            continue;
        }
        order.push_back(i);
    }
    if (report.skipped > 0)
        spdlog::warn("Cancelled: {} pages were not started", report.skipped);

    // Originals first, then replacements, each in path order.
    std::stable_sort(order.begin(), order.end(), [&pages](size_t a, size_t b) {
        if (pages[a].replacement != pages[b].replacement) return !pages[a].replacement;
        return pages[a].path < pages[b].path;
    });

    for (size_t i : order) {
        PageResult& r = *slots[i];
        ++report.processed;
        if (!r.usable()) ++report.failed;
        else {
            PageContribution c;
            c.studentId = r.studentId;
            c.page = r.page;
            c.replacement = r.replacement;
            c.source = r.source;
            c.answers = r.answers;
            report.answers.merge(c);
        }
        for (const auto& f : r.failures) {
            spdlog::warn("{} page {}: {} ({})", f.studentId, f.page, toString(f.reason), f.detail);
            report.failures.push_back(f);
        }
    }

    for (const auto& f : report.answers.conflicts()) report.failures.push_back(f);
    reportMissingPages(pages, report);

    for (auto& slot : slots)
        if (slot) report.results.push_back(std::move(*slot));
    std::sort(report.results.begin(), report.results.end(),
              [](const PageResult& a, const PageResult& b) { return a.source < b.source; });

    spdlog::info("Batch done: {} discovered, {} processed, {} failed, {} skipped",
                 report.discovered, report.processed, report.failed, report.skipped);
    return report;
}

void BatchRunner::reportMissingPages(const std::vector<RawPage>& pages, BatchReport& report) const {
    std::map<std::string, std::set<int>> submitted;
    for (const auto& p : pages) submitted[p.studentId].insert(p.page);

    for (const auto& [student, have] : submitted) {
        for (int page : layout_.pages()) {
            if (have.count(page)) continue;
            PageFailure f;
            f.studentId = student;
            f.page = page;
            f.reason = FailureReason::MissingLayoutEntry;
            f.detail = "no scan submitted for page " + std::to_string(page);
            report.failures.push_back(f);
        }
    }
}

}
