#ifndef OMR_PIPELINE_CONFIG_HPP
#define OMR_PIPELINE_CONFIG_HPP

#include "omr/CalibrationTable.hpp"
#include "omr/FormSplitter.hpp"
#include "omr/LayoutResolver.hpp"
#include "omr/Logger.hpp"
#include "omr/ScoreCalculator.hpp"
#include "omr/Types.hpp"

#include <string>

namespace omr {

// Everything one pipeline run depends on; passed by value, never global
struct PipelineConfig {
    RatingScale ratings = RatingScale::starRatings();
    LayoutConfig layout = defaultLayoutConfig();
    CalibrationTable calibration = defaultCalibrationTable();
    ScoringPolicy scoring;
    FormSplitConfig split;

    int expectedQuestions = 20;
    int dpi = 300;
    std::string debugDir;
    int workerThreads = 1;
    double minContrast = 2.0;
    LogLevel logLevel = LogLevel::Info;
};

PipelineConfig defaultPipelineConfig();

// Keys missing from the JSON keep their defaults. Throws ConfigError.
PipelineConfig loadPipelineConfig(const std::string& path);
PipelineConfig parsePipelineConfig(const std::string& jsonText);

// Throws ConfigError describing the first violated constraint
void validatePipelineConfig(const PipelineConfig& config);

} // namespace omr

#endif // OMR_PIPELINE_CONFIG_HPP
