#include "omr/OmrPipeline.hpp"
#include "omr/Errors.hpp"
#include "omr/Logger.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace omr {

OmrPipeline::OmrPipeline(PipelineConfig config)
    : config_(std::move(config))
{
    validatePipelineConfig(config_);
}

PipelineConfig OmrPipeline::effectiveConfig(const OmrRequest& request) const {
    PipelineConfig cfg = config_;
    if (request.expectedQuestions) cfg.expectedQuestions = *request.expectedQuestions;
    if (request.debugDir) cfg.debugDir = *request.debugDir;
    if (request.formsPerPage) cfg.split.formsPerPage = *request.formsPerPage;
    validatePipelineConfig(cfg);
    return cfg;
}

PipelineResult OmrPipeline::decode(const std::vector<cv::Mat>& pages, const Layout& layout,
                                   const PipelineConfig& cfg, const OmrRequest& request) const {
    PipelineResult result;
    result.ratings = cfg.ratings;
    result.subjects = layout.subjects();
    result.layoutSource = layout.source;
    result.expectedQuestions = cfg.expectedQuestions;
    result.pageCount = static_cast<int>(pages.size());

    AggregatorOptions options;
    options.expectedQuestions = cfg.expectedQuestions;
    options.debugDir = cfg.debugDir;
    options.workerThreads = cfg.workerThreads;
    options.minContrast = cfg.minContrast;

    FormAggregator aggregator(cfg.ratings, cfg.calibration, options, cfg.split);
    AggregationResult aggregation = aggregator.aggregate(pages, layout);

    ScoreCalculator calculator(cfg.ratings, cfg.scoring, cfg.expectedQuestions);
    FeedbackReport report = calculator.calculateFullReport(aggregation, request.respondents);
    calculator.scoreForms(aggregation.forms);

    result.responses = report.responses;
    result.totals = std::move(aggregation.totals);
    result.scores = std::move(report.subjectScores);
    result.forms = std::move(aggregation.forms);

    for (const auto& subject : result.subjects) {
        const SubjectScore& s = result.scores[subject];
        std::ostringstream oss;
        oss << subject << ": " << std::fixed << std::setprecision(2) << s.percentage
            << "% (" << s.verdict.label << ")";
        logInfo(oss.str());
    }
    return result;
}

PipelineResult OmrPipeline::runOnPages(const std::vector<cv::Mat>& pages,
                                       const OmrRequest& request) const {
    PipelineConfig cfg = effectiveConfig(request);
    LayoutResolver resolver(cfg.layout);
    Layout layout = resolver.resolve(request.subjects, request.phase);

    if (pages.empty()) {
        PipelineResult empty;
        empty.status = RunStatus::LoadFailed;
        empty.message = "no pages found";
        empty.ratings = cfg.ratings;
        empty.expectedQuestions = cfg.expectedQuestions;
        return empty;
    }
    return decode(pages, layout, cfg, request);
}

PipelineResult OmrPipeline::run(OmrRequest request) const {
    PipelineConfig cfg = effectiveConfig(request);

    // layout does not depend on the document, resolve it first
    LayoutResolver resolver(cfg.layout);
    Layout layout = resolver.resolve(request.subjects, request.phase);

    DocumentLoader loader(cfg.dpi);
    std::vector<cv::Mat> pages;
    try {
        if (request.document.fromBytes()) {
            pages = loader.loadBytes(std::move(request.document.bytes), request.document.kind);
        } else {
            pages = loader.loadFile(request.document.path, request.document.kind);
        }
    } catch (const LoadError& e) {
        logError(e.what());
        PipelineResult failed;
        failed.status = RunStatus::LoadFailed;
        failed.message = e.what();
        failed.ratings = cfg.ratings;
        failed.expectedQuestions = cfg.expectedQuestions;
        return failed;
    }

    return decode(pages, layout, cfg, request);
}

} // namespace omr
