#include <gtest/gtest.h>
#include "omr/BubbleLayout.hpp"
#include "omr/Errors.hpp"

#include <sstream>

using namespace omr;

namespace {

BubbleLayout parse(const std::string& csv) {
    std::istringstream in(csv);
    return BubbleLayout::fromStream(in, "test.csv");
}

const char* kHeader = "page,question,subquestion,choice,Xpos,Ypos\n";

}

// =============================================================================
// Row parsing
// =============================================================================

TEST(BubbleLayoutTest, PlainQuestion_IsChoice) {
    BubbleDefinition d = makeBubbleDefinition(2, "7", "b", "C", 10, 20);
    EXPECT_EQ(d.kind, BubbleKind::Choice);
    EXPECT_EQ(d.problem, "7");
    EXPECT_EQ(d.slot, -1);
    EXPECT_EQ(d.label, "C");
    EXPECT_EQ(d.column(), "7.b");
    EXPECT_EQ(d.key(), "7.b_C");
}

TEST(BubbleLayoutTest, ThreePartQuestion_IsDigitSlot) {
    BubbleDefinition d = makeBubbleDefinition(1, "1-2-7", "i", "Other", 0, 0);
    EXPECT_EQ(d.kind, BubbleKind::Digit);
    EXPECT_EQ(d.problem, "1");
    EXPECT_EQ(d.slot, 2);
    EXPECT_EQ(d.label, "7");
    EXPECT_EQ(d.key(), "1.i_1-2-7");
}

TEST(BubbleLayoutTest, TwoPartQuestion_TakesLabelFromChoice) {
    BubbleDefinition d = makeBubbleDefinition(1, "4-3", "a", "d", 0, 0);
    EXPECT_EQ(d.kind, BubbleKind::Separator);
    EXPECT_EQ(d.slot, 3);
    EXPECT_EQ(d.label, "D");
}

TEST(BubbleLayoutTest, BadSlotLabel_Throws) {
    EXPECT_THROW(makeBubbleDefinition(1, "1-1-x", "a", "Other", 0, 0), LayoutException);
    EXPECT_THROW(makeBubbleDefinition(1, "1-a-1", "a", "Other", 0, 0), LayoutException);
    EXPECT_THROW(makeBubbleDefinition(1, "1-1-1-1", "a", "Other", 0, 0), LayoutException);
    EXPECT_THROW(makeBubbleDefinition(1, "1", "", "A", 0, 0), LayoutException);
}

// =============================================================================
// Table loading
// =============================================================================

TEST(BubbleLayoutTest, FromStream_ParsesRowsAndGroups) {
    std::string csv = kHeader;
    csv += "1,1,a,A,100,500\n";
    csv += "1,1,a,B,120,500\n";
    csv += "1,1,b,A,100,480\n";
    csv += "2,5,a,A,100,500\n";
    BubbleLayout layout = parse(csv);

    EXPECT_EQ(layout.definitions().size(), 4u);
    EXPECT_EQ(layout.groups().size(), 3u);
    EXPECT_EQ(layout.pages(), (std::vector<int>{1, 2}));
    EXPECT_TRUE(layout.hasPage(2));
    EXPECT_FALSE(layout.hasPage(3));

    const auto& subs = layout.subquestions(1);
    ASSERT_EQ(subs.size(), 2u);
    EXPECT_EQ(subs[0].column(), "1.a");
    EXPECT_EQ(subs[1].column(), "1.b");
    EXPECT_EQ(layout.group(subs[0].choiceGroup).members.size(), 2u);
    EXPECT_TRUE(layout.subquestions(9).empty());
}

TEST(BubbleLayoutTest, FromStream_HeaderIsCaseInsensitiveAndReorderable) {
    std::string csv = "\xEF\xBB\xBFYpos,XPOS,Choice,Subquestion,Question,Page\n";
    csv += "500,100,A,a,1,1\n\n";
    BubbleLayout layout = parse(csv);
    ASSERT_EQ(layout.definitions().size(), 1u);
    EXPECT_DOUBLE_EQ(layout.definitions()[0].xDesign, 100.0);
    EXPECT_DOUBLE_EQ(layout.definitions()[0].yDesign, 500.0);
}

TEST(BubbleLayoutTest, FromStream_MissingColumn_Throws) {
    EXPECT_THROW(parse("page,question,subquestion,choice,Xpos\n1,1,a,A,1\n"), LayoutException);
}

TEST(BubbleLayoutTest, FromStream_BadNumbers_Throw) {
    EXPECT_THROW(parse(std::string(kHeader) + "1,1,a,A,abc,500\n"), LayoutException);
    EXPECT_THROW(parse(std::string(kHeader) + "0,1,a,A,1,500\n"), LayoutException);
    EXPECT_THROW(parse(std::string(kHeader) + "1.5,1,a,A,1,500\n"), LayoutException);
    EXPECT_THROW(parse(std::string(kHeader) + "1e12,1,a,A,1,500\n"), LayoutException);
}

TEST(BubbleLayoutTest, ErrorNamesTheLine) {
    try {
        parse(std::string(kHeader) + "1,1,a,A,1,2\n1,1-1-q,a,Other,1,2\n");
        FAIL() << "expected LayoutException";
    } catch (const LayoutException& e) {
        EXPECT_NE(std::string(e.what()).find("test.csv:3"), std::string::npos);
    }
}

TEST(BubbleLayoutTest, DuplicateBubble_Throws) {
    std::string csv = kHeader;
    csv += "1,1,a,A,100,500\n";
    csv += "1,1,a,A,140,500\n";
    EXPECT_THROW(parse(csv), LayoutException);
}

TEST(BubbleLayoutTest, EmptyTable_Throws) {
    EXPECT_THROW(parse(kHeader), LayoutException);
    EXPECT_THROW(parse(""), LayoutException);
}

// =============================================================================
// Numeric grouping
// =============================================================================

TEST(BubbleLayoutTest, NumericRows_GroupPerSlot) {
    std::string csv = kHeader;
    csv += "1,1,a,A,100,500\n";
    csv += "1,1,a,Other,120,500\n";
    for (int d = 0; d < 10; ++d) csv += "1,1-1-" + std::to_string(d) + ",a,Other,200," + std::to_string(400 - d * 20) + "\n";
    csv += "1,1-2-D,a,Other,220,400\n";
    for (int d = 0; d < 10; ++d) csv += "1,1-3-" + std::to_string(d) + ",a,Other,240," + std::to_string(400 - d * 20) + "\n";
    BubbleLayout layout = parse(csv);

    const auto& subs = layout.subquestions(1);
    ASSERT_EQ(subs.size(), 1u);
    const SubquestionLayout& s = subs[0];
    ASSERT_EQ(s.slotGroups.size(), 3u);
    EXPECT_GE(s.choiceGroup, 0);

    EXPECT_EQ(layout.group(s.slotGroups[0]).key.slot, 1);
    EXPECT_EQ(layout.group(s.slotGroups[0]).members.size(), 10u);
    EXPECT_FALSE(layout.group(s.slotGroups[0]).separatorOnly);
    EXPECT_TRUE(layout.group(s.slotGroups[1]).separatorOnly);
    EXPECT_EQ(layout.group(s.slotGroups[2]).key.slot, 3);

    EXPECT_EQ(s.catchAll, (std::set<std::string>{"Other"}));
    EXPECT_EQ(layout.groupsOnPage(1).size(), 4u);
}

TEST(BubbleLayoutTest, DuplicateDigitInSlot_Throws) {
    std::string csv = kHeader;
    csv += "1,1-1-3,a,Other,200,400\n";
    csv += "1,1-1,a,3,200,380\n";
    EXPECT_THROW(parse(csv), LayoutException);
}

TEST(BubbleLayoutTest, ChoiceOnlySubquestion_HasNoCatchAll) {
    BubbleLayout layout = parse(std::string(kHeader) + "1,1,a,A,1,1\n1,1,a,Other,2,1\n");
    EXPECT_TRUE(layout.subquestions(1)[0].catchAll.empty());
}

// =============================================================================
// CSV splitting
// =============================================================================

TEST(BubbleLayoutTest, SplitCsvLine_HandlesQuotes) {
    EXPECT_EQ(splitCsvLine("a, b ,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(splitCsvLine("\"x,y\",\"he said \"\"hi\"\"\"\r"),
              (std::vector<std::string>{"x,y", "he said \"hi\""}));
    EXPECT_EQ(splitCsvLine("a,,"), (std::vector<std::string>{"a", "", ""}));
}
