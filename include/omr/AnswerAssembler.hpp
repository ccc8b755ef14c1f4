#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "omr/AnswerDecoder.hpp"
#include "omr/Errors.hpp"

namespace omr {

// Everything one decoded page wants to write into the table.
struct PageContribution {
    std::string studentId;
    int page = 0;
    bool replacement = false;
    std::string source;
    std::vector<DecodedAnswer> answers;
};

// Folds page answers into one row per student.
// Not thread-safe: the batch merges from a single thread.
class AnswerAssembler {
public:
    struct Cell {
        std::optional<std::string> value;
        std::string source;
        bool conflicted = false;   // locked until a replacement page arrives
        bool replaced = false;
    };

    using Row = std::map<std::string, Cell>;

    void merge(const PageContribution& contribution);

    const std::map<std::string, Row>& table() const { return table_; }
    const std::vector<PageFailure>& conflicts() const { return conflicts_; }

    bool hasCell(const std::string& studentId, const std::string& column) const;
    std::optional<std::string> value(const std::string& studentId, const std::string& column) const;

    std::vector<std::string> students() const;
    // Every column seen, problem number first, then subquestion.
    std::vector<std::string> columns() const;

    // 0 when `text` is not a canonical roman numeral.
    static int romanToInt(const std::string& text);
    static void sortColumns(std::vector<std::string>& columns);

private:
    void write(const std::string& studentId, const DecodedAnswer& answer,
               const PageContribution& from);
    void reportConflict(const std::string& studentId, const PageContribution& from,
                        const std::string& detail);

    std::map<std::string, Row> table_;
    std::vector<PageFailure> conflicts_;
};

}
