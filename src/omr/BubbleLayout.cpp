#include "omr/BubbleLayout.hpp"
#include "omr/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <tuple>

namespace omr {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, sep)) out.push_back(trim(tok));
    if (!s.empty() && s.back() == sep) out.push_back("");
    return out;
}

bool parseNonNegativeInt(const std::string& s, int& out) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    try {
        out = std::stoi(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

double parseNumber(const std::string& s, const std::string& what, const std::string& where) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        throw LayoutException(where + ": " + what + " '" + s + "' is not a number");
    }
    if (used != s.size() || !std::isfinite(v))
        throw LayoutException(where + ": " + what + " '" + s + "' is not a number");
    return v;
}

std::string slotLabel(const std::string& raw, const std::string& question) {
    std::string label = trim(raw);
    if (label.size() == 1 && std::isdigit(static_cast<unsigned char>(label[0])))
        return label;
    if (label == "d" || label == "D") return "D";
    if (label == "s" || label == "S") return "S";
    throw LayoutException("numeric bubble '" + question + "' has label '" + raw +
                          "', expected 0-9, D or S");
}

}

std::string BubbleDefinition::column() const {
    return problem + "." + subquestion;
}

std::string BubbleDefinition::key() const {
    if (slot < 0) return column() + "_" + choice;
    return column() + "_" + problem + "-" + std::to_string(slot) + "-" + label;
}

std::string GroupKey::describe() const {
    std::string s = "page " + std::to_string(page) + " " + problem + "." + subquestion;
    if (slot >= 0) s += " slot " + std::to_string(slot);
    return s;
}

bool GroupKey::operator<(const GroupKey& o) const {
    return std::tie(page, problem, subquestion, slot) <
           std::tie(o.page, o.problem, o.subquestion, o.slot);
}

bool GroupKey::operator==(const GroupKey& o) const {
    return page == o.page && problem == o.problem &&
           subquestion == o.subquestion && slot == o.slot;
}

BubbleDefinition makeBubbleDefinition(int page,
                                      const std::string& question,
                                      const std::string& subquestion,
                                      const std::string& choice,
                                      double xDesign,
                                      double yDesign) {
    BubbleDefinition d;
    d.page = page;
    d.question = trim(question);
    d.subquestion = trim(subquestion);
    d.choice = trim(choice);
    d.xDesign = xDesign;
    d.yDesign = yDesign;

    if (d.question.empty()) throw LayoutException("empty question id");
    if (d.subquestion.empty())
        throw LayoutException("question '" + d.question + "' has no subquestion");

    // "1" plain choice, "1-2" slot 2 labelled by choice, "1-2-5" slot 2 digit 5
    std::vector<std::string> parts = splitOn(d.question, '-');
    d.problem = parts[0];
    if (d.problem.empty()) throw LayoutException("question '" + d.question + "' has no problem number");

    if (parts.size() == 1) {
        if (d.choice.empty())
            throw LayoutException("question '" + d.question + "." + d.subquestion + "' has an empty choice");
        d.kind = BubbleKind::Choice;
        d.label = d.choice;
        return d;
    }

    if (parts.size() > 3 || !parseNonNegativeInt(parts[1], d.slot))
        throw LayoutException("malformed numeric question id '" + d.question + "'");

    d.label = slotLabel(parts.size() == 3 ? parts[2] : d.choice, d.question);
    d.kind = (d.label == "D" || d.label == "S") ? BubbleKind::Separator : BubbleKind::Digit;
    return d;
}

BubbleLayout::BubbleLayout(std::vector<BubbleDefinition> definitions)
    : defs_(std::move(definitions)) {
    build();
}

void BubbleLayout::build() {
    if (defs_.empty()) throw LayoutException("no bubble definitions");

    std::set<std::tuple<int, std::string, std::string, std::string>> authored;
    std::map<GroupKey, size_t> groupIndex;
    std::map<size_t, std::set<std::string>> groupLabels;

    for (size_t i = 0; i < defs_.size(); ++i) {
        const BubbleDefinition& d = defs_[i];
        if (!authored.insert(std::make_tuple(d.page, d.question, d.subquestion, d.choice)).second)
            throw LayoutException("duplicate bubble (page " + std::to_string(d.page) + ", " +
                                  d.question + ", " + d.subquestion + ", " + d.choice + ")");

        GroupKey key{d.page, d.problem, d.subquestion, d.slot};
        auto it = groupIndex.find(key);
        if (it == groupIndex.end()) {
            it = groupIndex.emplace(key, groups_.size()).first;
            groups_.push_back(BubbleGroup{key, {}, false});
        }
        if (!groupLabels[it->second].insert(d.label).second)
            throw LayoutException("label '" + d.label + "' appears twice in " + key.describe());
        groups_[it->second].members.push_back(i);
    }

    for (auto& g : groups_) {
        if (g.key.slot < 0) continue;
        g.separatorOnly = std::all_of(g.members.begin(), g.members.end(),
            [this](size_t m) { return defs_[m].kind == BubbleKind::Separator; });
    }

    // Subquestions in first-appearance order per page
    std::map<std::tuple<int, std::string, std::string>, size_t> subIndex;
    for (size_t gi = 0; gi < groups_.size(); ++gi) {
        const GroupKey& k = groups_[gi].key;
        auto id = std::make_tuple(k.page, k.problem, k.subquestion);
        auto& list = pages_[k.page];
        auto it = subIndex.find(id);
        if (it == subIndex.end()) {
            it = subIndex.emplace(id, list.size()).first;
            SubquestionLayout s;
            s.problem = k.problem;
            s.subquestion = k.subquestion;
            list.push_back(s);
        }
        SubquestionLayout& sub = list[it->second];
        if (k.slot < 0) sub.choiceGroup = static_cast<int>(gi);
        else sub.slotGroups.push_back(gi);
    }

    for (auto& entry : pages_) {
        for (auto& sub : entry.second) {
            std::sort(sub.slotGroups.begin(), sub.slotGroups.end(),
                      [this](size_t a, size_t b) { return groups_[a].key.slot < groups_[b].key.slot; });
            if (sub.slotGroups.empty()) continue;

            if (sub.choiceGroup >= 0)
                for (size_t m : groups_[sub.choiceGroup].members)
                    if (lower(defs_[m].label) == "other") sub.catchAll.insert(defs_[m].label);

            // three-part numeric rows name the choice they stand in for
            for (size_t gi : sub.slotGroups)
                for (size_t m : groups_[gi].members) {
                    const BubbleDefinition& d = defs_[m];
                    bool linked = std::count(d.question.begin(), d.question.end(), '-') == 2;
                    if (linked && !d.choice.empty()) sub.catchAll.insert(d.choice);
                }
        }
    }
}

std::vector<int> BubbleLayout::pages() const {
    std::vector<int> out;
    for (const auto& entry : pages_) out.push_back(entry.first);
    return out;
}

const std::vector<SubquestionLayout>& BubbleLayout::subquestions(int page) const {
    static const std::vector<SubquestionLayout> none;
    auto it = pages_.find(page);
    return it == pages_.end() ? none : it->second;
}

std::vector<size_t> BubbleLayout::groupsOnPage(int page) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < groups_.size(); ++i)
        if (groups_[i].key.page == page) out.push_back(i);
    return out;
}

BubbleLayout BubbleLayout::fromCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw LayoutException("cannot open " + path);
    return fromStream(in, path);
}

BubbleLayout BubbleLayout::fromStream(std::istream& in, const std::string& sourceName) {
    std::string line;
    if (!std::getline(in, line)) throw LayoutException(sourceName + " is empty");
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    const char* required[] = {"page", "question", "subquestion", "choice", "xpos", "ypos"};
    std::vector<std::string> header = splitCsvLine(line);
    int col[6];
    for (int r = 0; r < 6; ++r) {
        col[r] = -1;
        for (size_t h = 0; h < header.size(); ++h)
            if (lower(header[h]) == required[r]) col[r] = static_cast<int>(h);
        if (col[r] < 0)
            throw LayoutException(sourceName + ": missing column '" + required[r] + "'");
    }
    const int needed = *std::max_element(col, col + 6) + 1;

    std::vector<BubbleDefinition> defs;
    int lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;

        const std::string where = sourceName + ":" + std::to_string(lineNo);
        std::vector<std::string> f = splitCsvLine(line);
        if (static_cast<int>(f.size()) < needed)
            throw LayoutException(where + ": expected " + std::to_string(needed) + " fields");

        double page = parseNumber(f[col[0]], "page", where);
        if (page < 1 || page != std::floor(page) || page > std::numeric_limits<int>::max())
            throw LayoutException(where + ": page '" + f[col[0]] + "' is not a page number");

        const double x = parseNumber(f[col[4]], "Xpos", where);
        const double y = parseNumber(f[col[5]], "Ypos", where);
        try {
            defs.push_back(makeBubbleDefinition(static_cast<int>(page), f[col[1]], f[col[2]], f[col[3]], x, y));
        } catch (const LayoutException& e) {
            throw LayoutException(where + ": " + e.detail());
        }
    }
    return BubbleLayout(std::move(defs));
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    bool wasQuoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
                else quoted = false;
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
            wasQuoted = true;
        } else if (c == ',') {
            out.push_back(wasQuoted ? cur : trim(cur));
            cur.clear();
            wasQuoted = false;
        } else if (c != '\r') {
            cur += c;
        }
    }
    out.push_back(wasQuoted ? cur : trim(cur));
    return out;
}

}
