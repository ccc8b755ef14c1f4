#include <opencv2/core.hpp>

#include <atomic>
#include <csignal>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "omr/BatchRunner.hpp"
#include "omr/BubbleLayout.hpp"
#include "omr/Config.hpp"
#include "omr/Logging.hpp"
#include "omr/MarkerLocator.hpp"
#include "omr/ResultWriter.hpp"

using namespace cv;

namespace {

std::atomic<bool> g_cancel{false};

void onInterrupt(int) { g_cancel = true; }

const char* kKeys =
    "{help h usage ? |      | print this message }"
    "{marker m       |      | marker template image }"
    "{bubbles b      |      | bubble table CSV }"
    "{input i        |      | folder of <page>/<student>_<page>[_suffix] scans }"
    "{output o       |      | output folder (default <input>_OMR) }"
    "{config c       |      | YAML config overriding the defaults }"
    "{workers w      | -1   | decoding threads, 0 = one per core }"
    "{overlay        | false| write annotated page images }"
    "{verbose v      | false| debug logging }";

}

int main(int argc, char** argv) {
    CommandLineParser parser(argc, argv, kKeys);
    parser.about("omr - decode scanned answer sheets into a per-student answer table");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    const std::string marker = parser.get<std::string>("marker");
    const std::string bubbles = parser.get<std::string>("bubbles");
    const std::string input = parser.get<std::string>("input");
    std::string output = parser.get<std::string>("output");
    const std::string configPath = parser.get<std::string>("config");
    const int workers = parser.get<int>("workers");
    const bool overlay = parser.get<bool>("overlay");
    const bool verbose = parser.get<bool>("verbose");
    if (!parser.check()) {
        parser.printErrors();
        return 2;
    }
    if (marker.empty() || bubbles.empty() || input.empty()) {
        parser.printMessage();
        return 2;
    }
    if (output.empty()) output = input + "_OMR";

    try {
        omr::OmrConfig config = configPath.empty() ? omr::OmrConfig() : omr::loadConfig(configPath);
        if (workers >= 0) config.workers = workers;
        if (overlay) config.writeOverlays = true;
        if (verbose) config.logLevel = "debug";
        omr::validateConfig(config);
        omr::setupLogging(config.logLevel);

        const omr::BubbleLayout layout = omr::BubbleLayout::fromCsv(bubbles);
        const Mat tmpl = omr::loadMarkerTemplate(marker);
        spdlog::info("Layout: {} bubbles in {} groups over {} pages", layout.definitions().size(),
                     layout.groups().size(), layout.pages().size());

        const std::vector<omr::RawPage> pages = omr::discoverPages(input);
        if (pages.empty()) spdlog::warn("No page images under {}", input);

        std::signal(SIGINT, onInterrupt);
        omr::BatchRunner runner(layout, tmpl, config);
        const omr::BatchReport report = runner.run(pages, &g_cancel);

        omr::ResultWriter(output).writeAll(report);
        return g_cancel ? 130 : 0;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
