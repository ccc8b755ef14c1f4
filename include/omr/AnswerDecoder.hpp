#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "omr/BubbleLayout.hpp"
#include "omr/BubbleSampler.hpp"
#include "omr/ThresholdEstimator.hpp"

namespace omr {

// One bubble group after sampling and thresholding.
struct GroupEvaluation {
    size_t group = 0;                  // index into BubbleLayout::groups()
    bool separator = false;            // printed separator, not sampled
    ThresholdDecision threshold;
    std::vector<BubbleReading> readings;
    std::vector<bool> filled;          // parallel to readings

    std::vector<std::string> filledLabels() const;
};

struct DecodedAnswer {
    std::string studentId;
    std::string problem;
    std::string subquestion;
    std::optional<std::string> value;   // empty optional: nothing passed the threshold
    bool ambiguous = false;

    std::string column() const { return problem + "." + subquestion; }
};

struct ChoiceResult {
    std::optional<std::string> value;
    bool ambiguous = false;
};

struct SlotOutcome {
    bool separator = false;            // printed separator slot
    std::string label;                 // separator label (D or S) when separator
    std::vector<std::string> filled;   // filled labels when sampled
};

class AnswerDecoder {
public:
    explicit AnswerDecoder(const BubbleLayout& layout);

    // Exactly one label -> value; none -> empty; several -> ambiguous.
    static ChoiceResult decodeSingleChoice(const std::vector<std::string>& filled);

    // Slots in positional order. Empty value when no digit was read.
    static ChoiceResult assembleNumeric(const std::vector<SlotOutcome>& slots);

    static char literalFor(const std::string& label);

    // filledByGroup maps group index -> filled labels for every sampled group of the page.
    DecodedAnswer decode(const std::string& studentId,
                         const SubquestionLayout& sub,
                         const std::map<size_t, std::vector<std::string>>& filledByGroup) const;

private:
    const BubbleLayout& layout_;
};

}
