#ifndef OMR_SCORE_CALCULATOR_HPP
#define OMR_SCORE_CALCULATOR_HPP

#include "omr/FormAggregator.hpp"
#include "omr/Types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omr {

// What the maximum possible score is built from
enum class NormalizationMode {
    Respondents,      // caller-supplied respondent count
    Forms,            // number of forms decoded
    MarkedResponses   // marked slots only: average per answered question
};

const char* normalizationModeName(NormalizationMode mode);
std::optional<NormalizationMode> parseNormalizationMode(const std::string& name);

struct VerdictLabels {
    std::string pass = "Pass";
    std::string fail = "Fail";
};

struct ScoringPolicy {
    NormalizationMode mode = NormalizationMode::Forms;
    double percentageCutoff = 80.0;
    // normalized subject -> marked slots required per response; these subjects
    // are judged by completion instead of percentage
    std::map<std::string, int> responseCutoffs;
    VerdictLabels labels;
};

struct FeedbackReport {
    std::map<std::string, SubjectScore> subjectScores;
    int responses = 0;
};

class ScoreCalculator {
public:
    ScoreCalculator(RatingScale ratings, ScoringPolicy policy, int expectedQuestions);

    long long weightedScore(const RatingCounts& counts) const;

    // responses x expected questions x heaviest weight
    long long maxScore(int responses) const;

    // 100 * score / max, clamped to [0, 100], 2 decimals; 0 when max is 0
    static double percentage(long long score, long long maxScore);

    Verdict verdict(const std::string& subject, double percentage, int marked, int responses) const;

    SubjectScore calculateScore(const std::string& subject, const RatingCounts& counts, int responses) const;

    // Number of responses the aggregate is normalized by, under the policy mode
    int responsesFor(const AggregationResult& aggregation, std::optional<int> respondents) const;

    FeedbackReport calculateFullReport(const AggregationResult& aggregation,
                                       std::optional<int> respondents) const;

    // Scores each form on its own (one response per form)
    void scoreForms(std::vector<PerFormRecord>& forms) const;

    const ScoringPolicy& policy() const { return policy_; }

private:
    RatingScale ratings_;
    ScoringPolicy policy_;
    int expectedQuestions_;
};

} // namespace omr

#endif // OMR_SCORE_CALCULATOR_HPP
