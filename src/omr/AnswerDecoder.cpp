#include "omr/AnswerDecoder.hpp"

#include <algorithm>

namespace omr {

std::vector<std::string> GroupEvaluation::filledLabels() const {
    std::vector<std::string> out;
    for (size_t i = 0; i < readings.size() && i < filled.size(); ++i)
        if (filled[i] && readings[i].definition) out.push_back(readings[i].definition->label);
    return out;
}

AnswerDecoder::AnswerDecoder(const BubbleLayout& layout) : layout_(layout) {}

char AnswerDecoder::literalFor(const std::string& label) {
    if (label == "D") return '.';
    if (label == "S") return '/';
    return label.empty() ? '?' : label[0];
}

ChoiceResult AnswerDecoder::decodeSingleChoice(const std::vector<std::string>& filled) {
    ChoiceResult R;
    if (filled.size() == 1) R.value = filled.front();
    else if (filled.size() > 1) R.ambiguous = true;
    return R;
}

ChoiceResult AnswerDecoder::assembleNumeric(const std::vector<SlotOutcome>& slots) {
    ChoiceResult R;
    std::string text;
    bool anyDigit = false;

    for (const auto& slot : slots) {
        if (slot.separator) {
            text += literalFor(slot.label);
            continue;
        }
        ChoiceResult c = decodeSingleChoice(slot.filled);
        if (c.ambiguous) {
            R.ambiguous = true;
            return R;
        }
        if (!c.value) continue;
        const std::string& v = *c.value;
        if (v != "D" && v != "S") anyDigit = true;
        text += literalFor(v);
    }

    // Separators alone are not an answer.
    if (anyDigit) R.value = text;
    return R;
}

DecodedAnswer AnswerDecoder::decode(const std::string& studentId,
                                    const SubquestionLayout& sub,
                                    const std::map<size_t, std::vector<std::string>>& filledByGroup) const {
    DecodedAnswer A;
    A.studentId = studentId;
    A.problem = sub.problem;
    A.subquestion = sub.subquestion;

    ChoiceResult numeric;
    if (!sub.slotGroups.empty()) {
        std::vector<SlotOutcome> slots;
        for (size_t gi : sub.slotGroups) {
            const BubbleGroup& g = layout_.group(gi);
            SlotOutcome s;
            if (g.separatorOnly) {
                s.separator = true;
                s.label = layout_.definitions()[g.members.front()].label;
            } else {
                auto it = filledByGroup.find(gi);
                if (it != filledByGroup.end()) s.filled = it->second;
            }
            slots.push_back(s);
        }
        numeric = assembleNumeric(slots);
    }

    std::vector<std::string> choices;
    if (sub.choiceGroup >= 0) {
        auto it = filledByGroup.find(static_cast<size_t>(sub.choiceGroup));
        if (it != filledByGroup.end()) choices = it->second;
    }

    // A numeric answer makes the catch-all choice redundant.
    if (numeric.value) {
        choices.erase(std::remove_if(choices.begin(), choices.end(),
                          [&sub](const std::string& c) { return sub.catchAll.count(c) > 0; }),
                      choices.end());
    }
    ChoiceResult choice = decodeSingleChoice(choices);

    if (numeric.ambiguous || choice.ambiguous || (numeric.value && choice.value)) {
        A.ambiguous = true;
        return A;
    }
    A.value = numeric.value ? numeric.value : choice.value;
    return A;
}

}
