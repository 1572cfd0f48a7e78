#include "omr/ScoreCalculator.hpp"
#include "omr/Logger.hpp"
#include "omr/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace omr {

const char* normalizationModeName(NormalizationMode mode) {
    switch (mode) {
        case NormalizationMode::Respondents:     return "respondents";
        case NormalizationMode::Forms:           return "forms";
        case NormalizationMode::MarkedResponses: return "marked_responses";
    }
    return "forms";
}

std::optional<NormalizationMode> parseNormalizationMode(const std::string& name) {
    std::string key = normalizeKey(name);
    if (key == "respondents") return NormalizationMode::Respondents;
    if (key == "forms" || key == "pages") return NormalizationMode::Forms;
    if (key == "marked_responses" || key == "marked") return NormalizationMode::MarkedResponses;
    return std::nullopt;
}

ScoreCalculator::ScoreCalculator(RatingScale ratings, ScoringPolicy policy, int expectedQuestions)
    : ratings_(std::move(ratings)),
      policy_(std::move(policy)),
      expectedQuestions_(expectedQuestions) {}

long long ScoreCalculator::weightedScore(const RatingCounts& counts) const {
    long long score = 0;
    for (size_t i = 0; i < ratings_.size(); ++i) {
        score += static_cast<long long>(counts.at(i)) * ratings_[i].weight;
    }
    return score;
}

long long ScoreCalculator::maxScore(int responses) const {
    if (responses <= 0) return 0;
    return static_cast<long long>(responses) * expectedQuestions_ * ratings_.maxWeight();
}

double ScoreCalculator::percentage(long long score, long long maxScore) {
    if (maxScore <= 0) return 0.0;
    double pct = 100.0 * static_cast<double>(score) / static_cast<double>(maxScore);
    pct = std::clamp(pct, 0.0, 100.0);
    return std::round(pct * 100.0) / 100.0;
}

Verdict ScoreCalculator::verdict(const std::string& subject, double percentage,
                                 int marked, int responses) const {
    Verdict v;
    auto it = policy_.responseCutoffs.find(normalizeKey(subject));
    if (it != policy_.responseCutoffs.end()) {
        v.rule = VerdictRule::ResponseCount;
        v.passed = responses > 0 && marked >= static_cast<long long>(it->second) * responses;
    } else {
        v.rule = VerdictRule::PercentageCutoff;
        v.passed = percentage >= policy_.percentageCutoff;
    }
    v.label = v.passed ? policy_.labels.pass : policy_.labels.fail;
    return v;
}

SubjectScore ScoreCalculator::calculateScore(const std::string& subject,
                                             const RatingCounts& counts,
                                             int responses) const {
    SubjectScore s;
    s.weightedScore = weightedScore(counts);
    s.markedResponses = counts.total();
    s.responses = responses;

    if (policy_.mode == NormalizationMode::MarkedResponses) {
        s.maxScore = static_cast<long long>(s.markedResponses) * ratings_.maxWeight();
    } else {
        s.maxScore = maxScore(responses);
    }

    s.percentage = percentage(s.weightedScore, s.maxScore);
    s.verdict = verdict(subject, s.percentage, s.markedResponses, responses);
    return s;
}

int ScoreCalculator::responsesFor(const AggregationResult& aggregation,
                                  std::optional<int> respondents) const {
    int forms = static_cast<int>(aggregation.forms.size());
    if (policy_.mode == NormalizationMode::Respondents) {
        if (respondents) return std::max(0, *respondents);
        logWarning("Respondent count not supplied, normalizing by " + std::to_string(forms) + " form(s)");
    }
    return forms;
}

FeedbackReport ScoreCalculator::calculateFullReport(const AggregationResult& aggregation,
                                                    std::optional<int> respondents) const {
    FeedbackReport report;
    report.responses = responsesFor(aggregation, respondents);

    for (const auto& [subject, counts] : aggregation.totals) {
        report.subjectScores[subject] = calculateScore(subject, counts, report.responses);
    }
    return report;
}

void ScoreCalculator::scoreForms(std::vector<PerFormRecord>& forms) const {
    for (auto& form : forms) {
        form.scores.clear();
        for (const auto& [subject, counts] : form.counts) {
            form.scores[subject] = calculateScore(subject, counts, 1);
        }
    }
}

} // namespace omr
