#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "omr/AnswerAssembler.hpp"
#include "omr/BatchRunner.hpp"

namespace omr {

std::string escapeCsv(const std::string& field);

class ResultWriter {
public:
    explicit ResultWriter(const std::string& outputDir);

    // consolidated_answers.csv, failures.csv, page_<p>/<p>_OMR.csv and overlays.
    void writeAll(const BatchReport& report) const;

    static void writeConsolidated(std::ostream& out, const AnswerAssembler& answers);
    static void writeFailures(std::ostream& out, const std::vector<PageFailure>& failures);
    void writePageReadings(std::ostream& out, const std::vector<const PageResult*>& pages) const;

    const std::string& outputDir() const { return dir_; }

private:
    std::string dir_;
};

}
