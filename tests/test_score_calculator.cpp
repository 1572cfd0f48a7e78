/**
 * @file test_score_calculator.cpp
 * @brief Unit tests for weighted scores, percentages and verdicts
 */

#include <gtest/gtest.h>

#include "omr/FormAggregator.hpp"
#include "omr/ScoreCalculator.hpp"

#include <algorithm>
#include <limits>
#include <vector>

using namespace omr;

namespace {

ScoreCalculator makeCalculator(ScoringPolicy policy = ScoringPolicy(), int questions = 20) {
    return ScoreCalculator(RatingScale::starRatings(), policy, questions);
}

} // namespace

TEST(ScoreCalculatorTest, PhysicsExampleUnderPercentageCutoff) {
    ScoreCalculator calc = makeCalculator();
    SubjectScore s = calc.calculateScore("Physics", RatingCounts{12, 5, 3}, 1);

    EXPECT_EQ(s.weightedScore, 78);
    EXPECT_EQ(s.maxScore, 100);
    EXPECT_DOUBLE_EQ(s.percentage, 78.0);
    EXPECT_EQ(s.markedResponses, 20);
    EXPECT_FALSE(s.verdict.passed);
    EXPECT_EQ(s.verdict.label, "Fail");
    EXPECT_EQ(s.verdict.rule, VerdictRule::PercentageCutoff);
}

TEST(ScoreCalculatorTest, PhysicsExampleUnderResponseCountPolicy) {
    ScoringPolicy policy;
    policy.responseCutoffs["physics"] = 16;
    ScoreCalculator calc = makeCalculator(policy);

    SubjectScore s = calc.calculateScore("Physics", RatingCounts{12, 5, 3}, 1);
    EXPECT_DOUBLE_EQ(s.percentage, 78.0);
    EXPECT_TRUE(s.verdict.passed);
    EXPECT_EQ(s.verdict.label, "Pass");
    EXPECT_EQ(s.verdict.rule, VerdictRule::ResponseCount);

    SubjectScore thin = calc.calculateScore("Physics", RatingCounts{10, 5, 0}, 1);
    EXPECT_FALSE(thin.verdict.passed);

    // other subjects keep the percentage rule
    SubjectScore other = calc.calculateScore("English", RatingCounts{12, 5, 3}, 1);
    EXPECT_EQ(other.verdict.rule, VerdictRule::PercentageCutoff);
}

TEST(ScoreCalculatorTest, ResponseCutoffScalesWithResponses) {
    ScoringPolicy policy;
    policy.responseCutoffs["english"] = 16;
    ScoreCalculator calc = makeCalculator(policy);

    EXPECT_TRUE(calc.verdict("English", 0.0, 32, 2).passed);
    EXPECT_FALSE(calc.verdict("English", 100.0, 31, 2).passed);
    EXPECT_FALSE(calc.verdict("English", 100.0, 0, 0).passed);
}

TEST(ScoreCalculatorTest, CustomLabels) {
    ScoringPolicy policy;
    policy.labels.pass = "Yes";
    policy.labels.fail = "No";
    ScoreCalculator calc = makeCalculator(policy);

    EXPECT_EQ(calc.calculateScore("Maths", RatingCounts{20, 0, 0}, 1).verdict.label, "Yes");
    EXPECT_EQ(calc.calculateScore("Maths", RatingCounts{0, 0, 20}, 1).verdict.label, "No");
}

TEST(ScoreCalculatorTest, CutoffIsInclusive) {
    ScoreCalculator calc = makeCalculator();
    SubjectScore s = calc.calculateScore("Maths", RatingCounts{16, 0, 0}, 1);
    EXPECT_DOUBLE_EQ(s.percentage, 80.0);
    EXPECT_TRUE(s.verdict.passed);
}

TEST(ScoreCalculatorTest, PercentageClampsAndRounds) {
    EXPECT_DOUBLE_EQ(ScoreCalculator::percentage(150, 100), 100.0);
    EXPECT_DOUBLE_EQ(ScoreCalculator::percentage(-5, 100), 0.0);
    EXPECT_DOUBLE_EQ(ScoreCalculator::percentage(1, 3), 33.33);
    EXPECT_DOUBLE_EQ(ScoreCalculator::percentage(2, 3), 66.67);
}

TEST(ScoreCalculatorTest, ZeroMaximumGivesZeroPercent) {
    EXPECT_DOUBLE_EQ(ScoreCalculator::percentage(10, 0), 0.0);

    ScoreCalculator calc = makeCalculator();
    EXPECT_EQ(calc.maxScore(0), 0);
    SubjectScore s = calc.calculateScore("Physics", RatingCounts{3, 0, 0}, 0);
    EXPECT_EQ(s.maxScore, 0);
    EXPECT_DOUBLE_EQ(s.percentage, 0.0);
}

TEST(ScoreCalculatorTest, MarkedResponsesMode) {
    ScoringPolicy policy;
    policy.mode = NormalizationMode::MarkedResponses;
    ScoreCalculator calc = makeCalculator(policy);

    SubjectScore s = calc.calculateScore("Physics", RatingCounts{2, 2, 0}, 3);
    EXPECT_EQ(s.weightedScore, 16);
    EXPECT_EQ(s.maxScore, 20);
    EXPECT_DOUBLE_EQ(s.percentage, 80.0);

    SubjectScore none = calc.calculateScore("Physics", RatingCounts(3), 3);
    EXPECT_DOUBLE_EQ(none.percentage, 0.0);
}

TEST(ScoreCalculatorTest, ResponsesFollowMode) {
    AggregationResult agg;
    agg.forms.resize(3);

    ScoringPolicy respondents;
    respondents.mode = NormalizationMode::Respondents;
    EXPECT_EQ(makeCalculator(respondents).responsesFor(agg, 7), 7);
    EXPECT_EQ(makeCalculator(respondents).responsesFor(agg, std::nullopt), 3);

    ScoringPolicy forms;
    forms.mode = NormalizationMode::Forms;
    EXPECT_EQ(makeCalculator(forms).responsesFor(agg, 7), 3);
}

TEST(ScoreCalculatorTest, FullReportScoresEverySubject) {
    AggregationResult agg;
    agg.forms.resize(2);
    agg.totals["Physics"] = RatingCounts{24, 10, 6};
    agg.totals["English"] = RatingCounts(3);

    FeedbackReport report = makeCalculator().calculateFullReport(agg, std::nullopt);
    EXPECT_EQ(report.responses, 2);
    ASSERT_EQ(report.subjectScores.size(), 2u);
    EXPECT_EQ(report.subjectScores.at("Physics").maxScore, 200);
    EXPECT_DOUBLE_EQ(report.subjectScores.at("Physics").percentage, 78.0);
    EXPECT_DOUBLE_EQ(report.subjectScores.at("English").percentage, 0.0);
}

TEST(ScoreCalculatorTest, FoldOrderGivesSamePercentage) {
    std::vector<RatingCounts> pages = {{5, 3, 2}, {10, 0, 0}, {0, 4, 6}, {7, 7, 1}};
    ScoreCalculator calc = makeCalculator();

    auto percentFor = [&](const std::vector<RatingCounts>& order) {
        RatingCounts total(3);
        for (const auto& c : order) total += c;
        return calc.calculateScore("Physics", total, static_cast<int>(order.size())).percentage;
    };

    double reference = percentFor(pages);
    std::sort(pages.begin(), pages.end(),
              [](const RatingCounts& a, const RatingCounts& b) { return a.values < b.values; });
    do {
        EXPECT_DOUBLE_EQ(percentFor(pages), reference);
    } while (std::next_permutation(pages.begin(), pages.end(),
                                   [](const RatingCounts& a, const RatingCounts& b) { return a.values < b.values; }));
}

TEST(ScoreCalculatorTest, EachFormScoredAsOneResponse) {
    std::vector<PerFormRecord> forms(2);
    forms[0].counts["Physics"] = RatingCounts{20, 0, 0};
    forms[1].counts["Physics"] = RatingCounts{0, 0, 20};

    makeCalculator().scoreForms(forms);
    EXPECT_EQ(forms[0].scores.at("Physics").maxScore, 100);
    EXPECT_DOUBLE_EQ(forms[0].scores.at("Physics").percentage, 100.0);
    EXPECT_DOUBLE_EQ(forms[1].scores.at("Physics").percentage, 20.0);
}

TEST(ScoreCalculatorTest, ParseModeNames) {
    EXPECT_EQ(parseNormalizationMode("Respondents"), NormalizationMode::Respondents);
    EXPECT_EQ(parseNormalizationMode("pages"), NormalizationMode::Forms);
    EXPECT_EQ(parseNormalizationMode("marked"), NormalizationMode::MarkedResponses);
    EXPECT_FALSE(parseNormalizationMode("median").has_value());
}

TEST(ScoreCalculatorTest, LargeRespondentCountsDoNotOverflow) {
    ScoreCalculator calc = makeCalculator();
    EXPECT_EQ(calc.maxScore(30000000), 3000000000LL);
    EXPECT_EQ(calc.maxScore(std::numeric_limits<int>::max()),
              static_cast<long long>(std::numeric_limits<int>::max()) * 100);

    // weighted score and maximum both exceed the int range
    RatingCounts counts{std::numeric_limits<int>::max(), 0, 0};
    SubjectScore s = calc.calculateScore("Physics", counts, 200000000);
    EXPECT_EQ(s.weightedScore, static_cast<long long>(std::numeric_limits<int>::max()) * 5);
    EXPECT_EQ(s.maxScore, 20000000000LL);
    EXPECT_GT(s.percentage, 0.0);
    EXPECT_LT(s.percentage, 100.0);

    ScoringPolicy policy;
    policy.responseCutoffs["physics"] = 16;
    EXPECT_FALSE(makeCalculator(policy).verdict("Physics", 0.0, 1000, 200000000).passed);
}
