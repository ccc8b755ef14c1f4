#include "omr/AnswerAssembler.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace omr {

namespace {

std::string describe(const std::optional<std::string>& v) {
    return v ? "'" + *v + "'" : "blank";
}

bool parseInt(const std::string& s, long& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    out = std::stol(s);
    return true;
}

std::pair<std::string, std::string> splitColumn(const std::string& column) {
    const auto dot = column.find('.');
    if (dot == std::string::npos) return {column, std::string()};
    return {column.substr(0, dot), column.substr(dot + 1)};
}

// Numbers before text, numbers by value, text lexicographically.
bool problemLess(const std::string& a, const std::string& b) {
    long ia = 0, ib = 0;
    const bool na = parseInt(a, ia), nb = parseInt(b, ib);
    if (na && nb) return ia != ib ? ia < ib : a < b;
    if (na != nb) return na;
    return a < b;
}

std::string intToRoman(int value) {
    static const std::pair<int, const char*> table[] = {
        {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"}, {100, "C"}, {90, "XC"},
        {50, "L"}, {40, "XL"}, {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}};
    std::string out;
    for (const auto& [n, s] : table)
        while (value >= n) { out += s; value -= n; }
    return out;
}

}

int AnswerAssembler::romanToInt(const std::string& text) {
    if (text.empty()) return 0;
    std::string upper;
    for (char c : text) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    auto digit = [](char c) {
        switch (c) {
            case 'I': return 1;    case 'V': return 5;   case 'X': return 10;
            case 'L': return 50;   case 'C': return 100; case 'D': return 500;
            case 'M': return 1000; default: return 0;
        }
    };

    int total = 0;
    for (size_t i = 0; i < upper.size(); ++i) {
        const int v = digit(upper[i]);
        if (v == 0) return 0;
        const int next = i + 1 < upper.size() ? digit(upper[i + 1]) : 0;
        total += v < next ? -v : v;
    }
    // Reject "IIII", "VX" and friends.
    if (total <= 0 || intToRoman(total) != upper) return 0;
    return total;
}

void AnswerAssembler::sortColumns(std::vector<std::string>& columns) {
    bool allRoman = !columns.empty();
    for (const auto& c : columns)
        if (romanToInt(splitColumn(c).second) == 0) { allRoman = false; break; }

    std::sort(columns.begin(), columns.end(), [allRoman](const std::string& a, const std::string& b) {
        const auto pa = splitColumn(a), pb = splitColumn(b);
        if (pa.first != pb.first) return problemLess(pa.first, pb.first);
        if (allRoman) {
            const int ra = romanToInt(pa.second), rb = romanToInt(pb.second);
            if (ra != rb) return ra < rb;
        }
        return pa.second < pb.second;
    });
}

void AnswerAssembler::merge(const PageContribution& contribution) {
    for (const auto& answer : contribution.answers)
        write(contribution.studentId, answer, contribution);
}

void AnswerAssembler::write(const std::string& studentId, const DecodedAnswer& answer,
                            const PageContribution& from) {
    Row& row = table_[studentId];
    const std::string column = answer.column();
    auto it = row.find(column);

    if (it == row.end()) {
        Cell c;
        c.value = answer.value;
        c.source = from.source;
        c.replaced = from.replacement;
        row.emplace(column, c);
        return;
    }

    Cell& cell = it->second;
    if (from.replacement) {
        cell.value = answer.value;
        cell.source = from.source;
        cell.conflicted = false;
        cell.replaced = true;
        return;
    }

    // A replacement already owns this cell; extra scans never override it.
    if (cell.replaced) return;

    // Locked cells stay blank, but every further scan is still reported.
    if (cell.conflicted) {
        reportConflict(studentId, from,
                       column + ": " + describe(answer.value) + " from " + from.source +
                           " conflicts with cell first read from " + cell.source);
        return;
    }
    if (cell.value == answer.value) return;

    reportConflict(studentId, from,
                   column + ": " + describe(cell.value) + " from " + cell.source +
                       " vs " + describe(answer.value) + " from " + from.source);
    cell.value.reset();
    cell.conflicted = true;
}

void AnswerAssembler::reportConflict(const std::string& studentId, const PageContribution& from,
                                     const std::string& detail) {
    PageFailure f;
    f.studentId = studentId;
    f.page = from.page;
    f.reason = FailureReason::DuplicateNonReplacement;
    f.detail = detail;
    f.source = from.source;
    conflicts_.push_back(f);
    spdlog::warn("Conflicting scans for {} {}", studentId, f.detail);
}

bool AnswerAssembler::hasCell(const std::string& studentId, const std::string& column) const {
    auto row = table_.find(studentId);
    return row != table_.end() && row->second.count(column) > 0;
}

std::optional<std::string> AnswerAssembler::value(const std::string& studentId,
                                                  const std::string& column) const {
    auto row = table_.find(studentId);
    if (row == table_.end()) return std::nullopt;
    auto cell = row->second.find(column);
    if (cell == row->second.end()) return std::nullopt;
    return cell->second.value;
}

std::vector<std::string> AnswerAssembler::students() const {
    std::vector<std::string> out;
    for (const auto& kv : table_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> AnswerAssembler::columns() const {
    std::set<std::string> seen;
    for (const auto& row : table_)
        for (const auto& cell : row.second) seen.insert(cell.first);
    std::vector<std::string> out(seen.begin(), seen.end());
    sortColumns(out);
    return out;
}

}
