#include "omr/Logger.hpp"
#include "omr/ResultJson.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace omr {

using json = nlohmann::json;

namespace {

json countsToJson(const RatingScale& ratings, const RatingCounts& counts) {
    json j = json::object();
    for (size_t i = 0; i < ratings.size(); ++i) {
        j[ratings[i].key] = counts.at(i);
    }
    return j;
}

json scoreToJson(const SubjectScore& s) {
    json j;
    j["weighted_score"] = s.weightedScore;
    j["max_score"] = s.maxScore;
    j["marked_responses"] = s.markedResponses;
    j["responses"] = s.responses;
    j["percentage"] = s.percentage;
    j["verdict"] = s.verdict.label;
    j["passed"] = s.verdict.passed;
    j["rule"] = s.verdict.rule == VerdictRule::ResponseCount ? "response_count" : "percentage_cutoff";
    return j;
}

} // namespace

std::string resultToJson(const PipelineResult& result, int indent) {
    json j;
    j["status"] = result.ok() ? "ok" : "load_failed";
    if (!result.message.empty()) j["message"] = result.message;
    j["page_count"] = result.pageCount;
    j["responses"] = result.responses;
    j["expected_questions"] = result.expectedQuestions;
    j["layout_source"] = layoutSourceName(result.layoutSource);
    j["subjects"] = result.subjects;

    json subjects = json::array();
    for (const auto& name : result.subjects) {
        json s;
        s["subject"] = name;
        auto c = result.totals.find(name);
        s["counts"] = countsToJson(result.ratings,
                                   c != result.totals.end() ? c->second : RatingCounts(result.ratings.size()));
        auto sc = result.scores.find(name);
        if (sc != result.scores.end()) s["score"] = scoreToJson(sc->second);
        subjects.push_back(s);
    }
    j["results"] = subjects;

    json forms = json::array();
    for (const auto& form : result.forms) {
        json f;
        f["page"] = form.pageIndex + 1;
        f["form"] = form.formIndex + 1;
        f["region"] = {form.region.x, form.region.y, form.region.width, form.region.height};
        json perSubject = json::object();
        for (const auto& [name, counts] : form.counts) {
            json s;
            s["counts"] = countsToJson(result.ratings, counts);
            auto sc = form.scores.find(name);
            if (sc != form.scores.end()) s["score"] = scoreToJson(sc->second);
            perSubject[name] = s;
        }
        f["subjects"] = perSubject;
        forms.push_back(f);
    }
    j["forms"] = forms;

    // names and messages come from argv and file paths, which need not be UTF-8
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool writeResultJson(const PipelineResult& result, const std::string& path) {
    std::string text;
    try {
        text = resultToJson(result);
    } catch (const json::exception& e) {
        logError(std::string("Cannot serialize result: ") + e.what());
        return false;
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.good()) {
        logError("Cannot open " + path + " for writing");
        return false;
    }
    out << text << std::endl;
    if (!out.good()) {
        logError("Failed writing " + path);
        return false;
    }
    return true;
}

} // namespace omr
