#ifndef OMR_OMR_PIPELINE_HPP
#define OMR_OMR_PIPELINE_HPP

#include "omr/DocumentLoader.hpp"
#include "omr/FormAggregator.hpp"
#include "omr/LayoutResolver.hpp"
#include "omr/PipelineConfig.hpp"
#include "omr/ScoreCalculator.hpp"
#include "omr/Types.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omr {

// Either a path or an in-memory buffer (used when path is empty)
struct DocumentSource {
    std::string path;
    std::vector<unsigned char> bytes;
    DocumentKind kind = DocumentKind::Auto;

    bool fromBytes() const { return path.empty(); }
};

struct OmrRequest {
    DocumentSource document;
    std::vector<std::string> subjects;      // explicit list, takes precedence
    std::string phase;                      // class/stream code
    std::optional<int> respondents;
    std::optional<int> expectedQuestions;   // overrides the configuration
    std::optional<std::string> debugDir;
    std::optional<int> formsPerPage;
};

enum class RunStatus {
    Ok,
    LoadFailed
};

struct PipelineResult {
    RunStatus status = RunStatus::Ok;
    std::string message;

    RatingScale ratings;
    std::vector<std::string> subjects;
    LayoutSource layoutSource = LayoutSource::Explicit;
    int expectedQuestions = 0;
    int pageCount = 0;
    int responses = 0;

    std::map<std::string, RatingCounts> totals;
    std::map<std::string, SubjectScore> scores;
    std::vector<PerFormRecord> forms;

    bool ok() const { return status == RunStatus::Ok; }
};

class OmrPipeline {
public:
    // Throws ConfigError for an invalid configuration
    explicit OmrPipeline(PipelineConfig config = defaultPipelineConfig());

    // LoadError is reported through the result (LoadFailed, no data);
    // LayoutError propagates.
    PipelineResult run(OmrRequest request) const;

    // Same as run() for pages that are already rasterized
    PipelineResult runOnPages(const std::vector<cv::Mat>& pages, const OmrRequest& request) const;

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;

    PipelineConfig effectiveConfig(const OmrRequest& request) const;
    PipelineResult decode(const std::vector<cv::Mat>& pages, const Layout& layout,
                          const PipelineConfig& cfg, const OmrRequest& request) const;
};

} // namespace omr

#endif // OMR_OMR_PIPELINE_HPP
