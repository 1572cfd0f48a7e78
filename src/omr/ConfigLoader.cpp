#include "omr/Errors.hpp"
#include "omr/PipelineConfig.hpp"
#include "omr/TextUtil.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace omr {

using json = nlohmann::json;

namespace {

SubjectCalibration calibrationFromJson(const json& j, const SubjectCalibration& base) {
    SubjectCalibration c = base;
    c.minArea = j.value("min_area", base.minArea);
    c.windowSize = j.value("window", base.windowSize);
    c.enhance = j.value("enhance", base.enhance);
    return c;
}

void readLayout(const json& j, LayoutConfig& layout) {
    layout.usableStart = j.value("usable_start", layout.usableStart);
    layout.usableEnd = j.value("usable_end", layout.usableEnd);
    layout.bandFill = j.value("band_fill", layout.bandFill);

    if (j.contains("columns_x")) {
        layout.columnsX = j.at("columns_x").get<std::vector<double>>();
    }

    if (j.contains("column_overrides")) {
        for (const auto& item : j.at("column_overrides").items()) {
            layout.columnOverrides[normalizeKey(item.key())] = item.value().get<std::vector<double>>();
        }
    }

    if (j.contains("phases")) {
        layout.phases.clear();
        for (const auto& p : j.at("phases")) {
            PhaseEntry entry;
            entry.codes = p.at("codes").get<std::vector<std::string>>();
            entry.subjects = p.at("subjects").get<std::vector<std::string>>();
            layout.phases.push_back(entry);
        }
    }

    if (j.contains("fallback_subjects")) {
        layout.fallbackSubjects = j.at("fallback_subjects").get<std::vector<std::string>>();
    }
}

void readCalibration(const json& j, CalibrationTable& table) {
    if (j.contains("default")) {
        table.setDefault(calibrationFromJson(j.at("default"), table.defaults()));
    }
    if (j.contains("subjects")) {
        for (const auto& item : j.at("subjects").items()) {
            // merged over the built-in entry for that subject, if any
            table.setOverride(item.key(), calibrationFromJson(item.value(), table.lookup(item.key())));
        }
    }
}

void readScoring(const json& j, ScoringPolicy& policy) {
    if (j.contains("mode")) {
        std::string name = j.at("mode").get<std::string>();
        auto mode = parseNormalizationMode(name);
        if (!mode) throw ConfigError("unknown scoring mode '" + name + "'");
        policy.mode = *mode;
    }

    policy.percentageCutoff = j.value("percentage_cutoff", policy.percentageCutoff);

    if (j.contains("response_cutoffs")) {
        policy.responseCutoffs.clear();
        for (const auto& item : j.at("response_cutoffs").items()) {
            policy.responseCutoffs[normalizeKey(item.key())] = item.value().get<int>();
        }
    }

    if (j.contains("labels")) {
        const json& labels = j.at("labels");
        policy.labels.pass = labels.value("pass", policy.labels.pass);
        policy.labels.fail = labels.value("fail", policy.labels.fail);
    }
}

PipelineConfig configFromJson(const json& j) {
    PipelineConfig config = defaultPipelineConfig();

    config.expectedQuestions = j.value("expected_questions", config.expectedQuestions);
    config.dpi = j.value("dpi", config.dpi);
    config.debugDir = j.value("debug_dir", config.debugDir);
    config.workerThreads = j.value("worker_threads", config.workerThreads);
    config.minContrast = j.value("min_contrast", config.minContrast);
    config.split.formsPerPage = j.value("forms_per_page", config.split.formsPerPage);

    if (j.contains("log_level")) {
        config.logLevel = parseLogLevel(j.at("log_level").get<std::string>());
    }

    if (j.contains("ratings")) {
        config.ratings.ratings.clear();
        for (const auto& r : j.at("ratings")) {
            config.ratings.ratings.push_back({r.at("key").get<std::string>(), r.at("weight").get<int>()});
        }
    }

    if (j.contains("layout")) readLayout(j.at("layout"), config.layout);
    if (j.contains("calibration")) readCalibration(j.at("calibration"), config.calibration);
    if (j.contains("scoring")) readScoring(j.at("scoring"), config.scoring);

    if (j.contains("form_split")) {
        const json& s = j.at("form_split");
        config.split.gapPercentile = s.value("gap_percentile", config.split.gapPercentile);
        config.split.smoothingRows = s.value("smoothing_rows", config.split.smoothingRows);
        config.split.minGapFraction = s.value("min_gap_fraction", config.split.minGapFraction);
    }

    return config;
}

bool validFraction(double v) {
    return v >= 0.0 && v <= 1.0;
}

void checkColumns(const std::vector<double>& columns, size_t ratingCount, const std::string& what) {
    if (columns.size() != ratingCount) {
        throw ConfigError(what + " has " + std::to_string(columns.size())
                          + " bubble columns for " + std::to_string(ratingCount) + " ratings");
    }
    for (double x : columns) {
        if (!validFraction(x)) throw ConfigError(what + " has a column outside [0, 1]");
    }
}

} // namespace

PipelineConfig defaultPipelineConfig() {
    return PipelineConfig();
}

void validatePipelineConfig(const PipelineConfig& config) {
    if (config.ratings.empty()) throw ConfigError("rating table is empty");

    std::set<std::string> keys;
    for (const auto& r : config.ratings.ratings) {
        if (r.key.empty()) throw ConfigError("rating with empty key");
        if (r.weight < 0) throw ConfigError("rating '" + r.key + "' has a negative weight");
        if (!keys.insert(r.key).second) throw ConfigError("duplicate rating '" + r.key + "'");
    }
    if (config.ratings.maxWeight() <= 0) throw ConfigError("all rating weights are zero");

    if (config.expectedQuestions <= 0) throw ConfigError("expected_questions must be positive");
    if (config.dpi <= 0) throw ConfigError("dpi must be positive");
    if (config.split.formsPerPage < 1) throw ConfigError("forms_per_page must be at least 1");
    if (config.workerThreads < 1) throw ConfigError("worker_threads must be at least 1");

    const LayoutConfig& layout = config.layout;
    if (!validFraction(layout.usableStart) || !validFraction(layout.usableEnd) ||
        layout.usableStart >= layout.usableEnd) {
        throw ConfigError("usable span must satisfy 0 <= start < end <= 1");
    }
    // a full share would leave no gap before the next subject's band
    if (layout.bandFill <= 0.0 || layout.bandFill >= 1.0) {
        throw ConfigError("band_fill must be in (0, 1)");
    }
    checkColumns(layout.columnsX, config.ratings.size(), "layout");
    for (const auto& entry : layout.columnOverrides) {
        checkColumns(entry.second, config.ratings.size(), "column override '" + entry.first + "'");
    }
    if (layout.fallbackSubjects.empty()) throw ConfigError("fallback subject list is empty");

    auto checkCalib = [](const SubjectCalibration& c, const std::string& what) {
        if (c.windowSize <= 0) throw ConfigError(what + ": window must be positive");
        if (c.minArea < 0) throw ConfigError(what + ": min_area must not be negative");
    };
    checkCalib(config.calibration.defaults(), "default calibration");
    for (const auto& entry : config.calibration.overrides()) {
        checkCalib(entry.second, "calibration '" + entry.first + "'");
    }

    for (const auto& entry : config.scoring.responseCutoffs) {
        if (entry.second < 0 || entry.second > config.expectedQuestions) {
            throw ConfigError("response cutoff for '" + entry.first + "' outside [0, expected_questions]");
        }
    }
}

PipelineConfig parsePipelineConfig(const std::string& jsonText) {
    PipelineConfig config;
    try {
        config = configFromJson(json::parse(jsonText));
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    validatePipelineConfig(config);
    return config;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parsePipelineConfig(buffer.str());
}

} // namespace omr
