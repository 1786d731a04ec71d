#include <gtest/gtest.h>
#include "document/flow_document.h"
#include "sanitizer/fragment_splicer.h"

using namespace docsan::document;
using namespace docsan::sanitizer;

namespace {

RunStyle styled(const std::string& font, bool bold, const std::string& color) {
    RunStyle s;
    s.font_name = font;
    s.bold = bold;
    s.color = color;
    return s;
}

} // namespace

class FragmentSplicerTest : public ::testing::Test {
protected:
    SpliceResult run(Paragraph& p, std::vector<Replacement> entries, SplicerOptions options = {}) {
        FragmentSplicer splicer(ReplacementSet(std::move(entries)), options);
        return splicer.splice(p);
    }
};

TEST_F(FragmentSplicerTest, LongestFirstPrecedence) {
    Paragraph p;
    p.addRun("Email Priya Anjali Fernando at work");

    auto result = run(p, {{"Priya", "person", "Person_1"},
                          {"Priya Anjali Fernando", "person", "Person_1"}});

    EXPECT_EQ(p.text(), "Email Person_1 at work");
    EXPECT_EQ(result.replacements, 1u);
}

TEST_F(FragmentSplicerTest, MatchAcrossThreeFragmentsKeepsStyles) {
    Paragraph p;
    p.addRun("Email: priya", styled("Arial", true, "000000"));
    p.addRun(".fernando92@finance", styled("Calibri", false, "1F4E79"));
    p.addRun(".lk", styled("Calibri", false, "FF0000"));
    std::vector<RunStyle> before;
    for (const docsan::document::Run* r : p.runs()) before.push_back(r->style);

    auto result = run(p, {{"priya.fernando92@finance.lk", "email", "person_1@example.com"}});

    EXPECT_EQ(result.replacements, 1u);
    EXPECT_EQ(p.text(), "Email: person_1@example.com");

    auto runs = p.runs();
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0]->text, "Email: person_1@example.com");
    EXPECT_EQ(runs[1]->text, "");
    EXPECT_EQ(runs[2]->text, "");
    for (size_t i = 0; i < runs.size(); ++i) {
        EXPECT_EQ(runs[i]->style, before[i]) << "run " << i;
    }
}

TEST_F(FragmentSplicerTest, LastFragmentKeepsSuffix) {
    Paragraph p;
    p.addRun("Call Jo");
    p.addRun("hn ");
    p.addRun("Do");
    p.addRun("e today");

    run(p, {{"John Doe", "person", "Person_1"}});

    auto runs = p.runs();
    EXPECT_EQ(runs[0]->text, "Call Person_1");
    EXPECT_EQ(runs[1]->text, "");
    EXPECT_EQ(runs[2]->text, "");
    EXPECT_EQ(runs[3]->text, " today");
}

TEST_F(FragmentSplicerTest, SingleFragmentKeepsPrefixAndSuffix) {
    Paragraph p;
    p.addRun("Dear ");
    p.addRun("Mr Perera, thanks");

    run(p, {{"Perera", "person", "Person_2"}});

    auto runs = p.runs();
    EXPECT_EQ(runs[0]->text, "Dear ");
    EXPECT_EQ(runs[1]->text, "Mr Person_2, thanks");
}

TEST_F(FragmentSplicerTest, ShortUppercaseTokenNeedsWordBoundary) {
    Paragraph p;
    p.addRun("within City audit ");
    p.addRun("IT");
    p.addRun(" team, it is IT.");

    auto result = run(p, {{"IT", "department", "Dept_1"}});

    EXPECT_EQ(p.text(), "within City audit Dept_1 team, it is Dept_1.");
    EXPECT_EQ(result.replacements, 2u);
}

TEST_F(FragmentSplicerTest, CaseInsensitiveByDefault) {
    Paragraph p;
    p.addRun("JOHN DOE, John Doe and john ");
    p.addRun("doe");

    auto result = run(p, {{"John Doe", "person", "Person_1"}});

    EXPECT_EQ(p.text(), "Person_1, Person_1 and Person_1");
    EXPECT_EQ(result.replacements, 3u);
}

TEST_F(FragmentSplicerTest, CaseInsensitiveForAccentedLetters) {
    Paragraph p;
    p.addRun("Signed: JOSÉ PERERA, josé perera and Jo");
    p.addRun("sé Pe");
    p.addRun("rera.");

    auto result = run(p, {{"José Perera", "person", "Person_1"}});

    EXPECT_EQ(p.text(), "Signed: Person_1, Person_1 and Person_1.");
    EXPECT_EQ(result.replacements, 3u);
}

TEST_F(FragmentSplicerTest, OccurrenceFormedBySpliceIsReplaced) {
    Paragraph p;
    p.addRun("xa");
    p.addRun("abby");

    auto result = run(p, {{"ab", "code", ""}});

    EXPECT_EQ(p.text(), "xy");
    EXPECT_EQ(result.replacements, 2u);
    EXPECT_EQ(result.abandoned_entries, 0u);
}

TEST_F(FragmentSplicerTest, ReplacementContainingOriginalTerminates) {
    Paragraph p;
    p.addRun("Ann and Ann");

    auto result = run(p, {{"Ann", "person", "Ann Smith"}});

    EXPECT_EQ(p.text(), "Ann Smith and Ann Smith");
    EXPECT_EQ(result.replacements, 2u);
    EXPECT_EQ(result.abandoned_entries, 0u);
}

TEST_F(FragmentSplicerTest, IdentityReplacementIsNoVisibleChange) {
    Paragraph p;
    p.addRun("Colombo office");

    auto result = run(p, {{"Colombo", "location", "Colombo"}});

    EXPECT_EQ(p.text(), "Colombo office");
    EXPECT_EQ(result.abandoned_entries, 0u);
}

TEST_F(FragmentSplicerTest, IterationBoundAbandonsEntry) {
    Paragraph p;
    p.addRun("x1 x1 x1");

    SplicerOptions options;
    options.max_iterations = 2;
    auto result = run(p, {{"x1", "code", "y"}}, options);

    EXPECT_EQ(p.text(), "y y x1");
    EXPECT_EQ(result.replacements, 2u);
    EXPECT_EQ(result.abandoned_entries, 1u);
}

TEST_F(FragmentSplicerTest, OverlappingOriginalsLeftmostLongestWins) {
    Paragraph p;
    p.addRun("Priya Anjali Fernando");

    run(p, {{"Anjali Fern", "person", "B"}, {"Priya Anjali", "person", "A"}});

    EXPECT_EQ(p.text(), "A Fernando");
}

TEST_F(FragmentSplicerTest, UnmatchedEntriesLeaveContainerUntouched) {
    Paragraph p;
    p.addRun("Nothing to see", styled("Arial", false, ""));

    auto result = run(p, {{"Priya", "person", "Person_1"}});

    EXPECT_FALSE(result.changed());
    EXPECT_EQ(p.text(), "Nothing to see");
    EXPECT_EQ(result.degraded_rewrites, 0u);
}

TEST_F(FragmentSplicerTest, FallbackRewritesHiddenNodes) {
    Paragraph p;
    p.addHyperlink("mailto:x@y.com", {docsan::document::Run{"x@y.com"}});
    ASSERT_EQ(p.fragmentCount(), 0u);

    auto result = run(p, {{"x@y.com", "email", "person_1@example.com"}});

    EXPECT_EQ(result.replacements, 1u);
    EXPECT_EQ(result.degraded_rewrites, 1u);
    EXPECT_EQ(p.visibleText(), "person_1@example.com");
}

TEST_F(FragmentSplicerTest, FallbackCanBeDisabled) {
    Paragraph p;
    p.addHyperlink("mailto:x@y.com", {docsan::document::Run{"x@y.com"}});

    SplicerOptions options;
    options.enable_fallback = false;
    auto result = run(p, {{"x@y.com", "email", "person_1@example.com"}}, options);

    EXPECT_FALSE(result.changed());
    EXPECT_EQ(p.visibleText(), "x@y.com");
}

TEST(FragmentMapTest, BoundariesAndOverlap) {
    Paragraph p;
    p.addRun("ab");
    p.addRun("");
    p.addRun("cde");

    FragmentMap map = FragmentMap::build(p);
    EXPECT_EQ(map.text, "abcde");
    ASSERT_EQ(map.bounds.size(), 3u);

    auto parts = map.overlapping(1, 3);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].index, 0u);
    EXPECT_EQ(parts[1].index, 2u);
}

TEST(MatchPatternTest, WordBoundaryRule) {
    EXPECT_TRUE(MatchPattern::needsWordBoundary("IT"));
    EXPECT_TRUE(MatchPattern::needsWordBoundary("SAP"));
    EXPECT_FALSE(MatchPattern::needsWordBoundary("SAPX"));
    EXPECT_FALSE(MatchPattern::needsWordBoundary("It"));
    EXPECT_FALSE(MatchPattern::needsWordBoundary("A1"));

    MatchPattern special("a.b+(c)");
    EXPECT_FALSE(special.findFirst("axb+(c)").has_value());
    auto m = special.findFirst("see A.B+(C) here");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->start, 4u);
    EXPECT_EQ(m->end, 11u);
}

TEST(MatchPatternTest, UnicodeCaseFoldingReportsByteOffsets) {
    MatchPattern pattern("müller");
    std::string text = "Grüße an MÜLLER";

    auto m = pattern.findFirst(text);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(text.substr(m->start, m->end - m->start), "MÜLLER");
    EXPECT_EQ(m->start, 11u);
    EXPECT_EQ(m->end, 18u);

    EXPECT_FALSE(pattern.findFirst(text, m->start + 1).has_value());
    EXPECT_FALSE(MatchPattern("josé").findFirst("JOSE").has_value());
}
