#include "omr/ResultWriter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace omr {

namespace {

std::ofstream openOut(const fs::path& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Exception("cannot write " + path.string());
    return out;
}

}

std::string escapeCsv(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

ResultWriter::ResultWriter(const std::string& outputDir) : dir_(outputDir) {}

void ResultWriter::writeConsolidated(std::ostream& out, const AnswerAssembler& answers) {
    const std::vector<std::string> columns = answers.columns();

    out << "student_id";
    for (const auto& c : columns) out << ',' << escapeCsv(c);
    out << '\n';

    for (const auto& student : answers.students()) {
        out << escapeCsv(student);
        for (const auto& c : columns) {
            out << ',';
            if (auto v = answers.value(student, c)) out << escapeCsv(*v);
        }
        out << '\n';
    }
}

void ResultWriter::writeFailures(std::ostream& out, const std::vector<PageFailure>& failures) {
    out << "student_id,page,reason,detail,source\n";
    for (const auto& f : failures) {
        out << escapeCsv(f.studentId) << ',' << f.page << ',' << toString(f.reason) << ','
            << escapeCsv(f.detail) << ',' << escapeCsv(f.source) << '\n';
    }
}

void ResultWriter::writePageReadings(std::ostream& out, const std::vector<const PageResult*>& pages) const {
    out << "student_id,source,bubble,intensity,threshold,filled\n";
    out << std::fixed << std::setprecision(2);
    for (const PageResult* r : pages) {
        for (const auto& g : r->groups) {
            for (size_t i = 0; i < g.readings.size(); ++i) {
                const BubbleReading& b = g.readings[i];
                const bool filled = i < g.filled.size() && g.filled[i];
                out << escapeCsv(r->studentId) << ',' << escapeCsv(r->source) << ','
                    << escapeCsv(b.definition ? b.definition->key() : std::string()) << ','
                    << b.intensity << ',' << g.threshold.threshold << ',' << (filled ? 1 : 0) << '\n';
            }
        }
    }
}

void ResultWriter::writeAll(const BatchReport& report) const {
    const fs::path root(dir_);
    fs::create_directories(root);

    {
        std::ofstream out = openOut(root / "consolidated_answers.csv");
        writeConsolidated(out, report.answers);
    }
    {
        std::ofstream out = openOut(root / "failures.csv");
        writeFailures(out, report.failures);
    }

    std::map<int, std::vector<const PageResult*>> byPage;
    for (const auto& r : report.results)
        if (r.alignment.ok) byPage[r.page].push_back(&r);

    for (const auto& [page, results] : byPage) {
        const fs::path pageDir = root / ("page_" + std::to_string(page));
        fs::create_directories(pageDir);
        {
            std::ofstream out = openOut(pageDir / (std::to_string(page) + "_OMR.csv"));
            writePageReadings(out, results);
        }
        for (const PageResult* r : results) {
            if (r->overlay.empty()) continue;
            // Named after the scan so duplicate copies keep separate overlays.
            const fs::path png = pageDir / (fs::path(r->source).stem().string() + ".png");
            if (!cv::imwrite(png.string(), r->overlay))
                spdlog::warn("Could not write overlay {}", png.string());
        }
    }

    spdlog::info("Results written to {}", root.string());
}

}
