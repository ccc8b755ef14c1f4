#pragma once
#include <istream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace omr {

enum class BubbleKind {
    Choice,     // letter / "Other" of a single-choice subquestion
    Digit,      // 0-9 inside a numeric slot
    Separator   // D (decimal point) or S (slash) inside a numeric slot
};

struct BubbleDefinition {
    // As authored in the bubble table
    int page = 0;
    std::string question;
    std::string subquestion;
    std::string choice;
    double xDesign = 0.0;
    double yDesign = 0.0;

    // Derived from `question` / `choice`
    std::string problem;
    BubbleKind kind = BubbleKind::Choice;
    int slot = -1;
    std::string label;

    std::string column() const;   // "{problem}.{subquestion}"
    std::string key() const;      // column + "_" + choice or slot id, unique per page
};

// Smallest group of mutually exclusive bubbles. slot == -1 is the choice set.
struct GroupKey {
    int page = 0;
    std::string problem;
    std::string subquestion;
    int slot = -1;

    std::string describe() const;
    bool operator<(const GroupKey& o) const;
    bool operator==(const GroupKey& o) const;
};

struct BubbleGroup {
    GroupKey key;
    std::vector<size_t> members;   // indices into BubbleLayout::definitions()
    bool separatorOnly = false;    // printed "." or "/" position, nothing to sample
};

struct SubquestionLayout {
    std::string problem;
    std::string subquestion;
    int choiceGroup = -1;            // index into BubbleLayout::groups(), -1 if none
    std::vector<size_t> slotGroups;  // ordered by slot position
    std::set<std::string> catchAll;  // choices dropped once a numeric value is read

    std::string column() const { return problem + "." + subquestion; }
};

// Parses one authored row; throws LayoutException on a malformed question id.
BubbleDefinition makeBubbleDefinition(int page,
                                      const std::string& question,
                                      const std::string& subquestion,
                                      const std::string& choice,
                                      double xDesign,
                                      double yDesign);

class BubbleLayout {
public:
    explicit BubbleLayout(std::vector<BubbleDefinition> definitions);

    // CSV with header page,question,subquestion,choice,Xpos,Ypos
    static BubbleLayout fromCsv(const std::string& path);
    static BubbleLayout fromStream(std::istream& in, const std::string& sourceName);

    const std::vector<BubbleDefinition>& definitions() const { return defs_; }
    const std::vector<BubbleGroup>& groups() const { return groups_; }
    const BubbleGroup& group(size_t index) const { return groups_.at(index); }

    std::vector<int> pages() const;
    bool hasPage(int page) const { return pages_.count(page) > 0; }
    const std::vector<SubquestionLayout>& subquestions(int page) const;
    std::vector<size_t> groupsOnPage(int page) const;

private:
    void build();

    std::vector<BubbleDefinition> defs_;
    std::vector<BubbleGroup> groups_;
    std::map<int, std::vector<SubquestionLayout>> pages_;
};

std::vector<std::string> splitCsvLine(const std::string& line);

}
