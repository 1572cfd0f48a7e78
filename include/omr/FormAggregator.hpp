#ifndef OMR_FORM_AGGREGATOR_HPP
#define OMR_FORM_AGGREGATOR_HPP

#include "omr/BubbleDetector.hpp"
#include "omr/CalibrationTable.hpp"
#include "omr/FormSplitter.hpp"
#include "omr/LayoutResolver.hpp"
#include "omr/Types.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace omr {

// Counts of one physical form, never merged with other forms
struct PerFormRecord {
    int pageIndex = 0;
    int formIndex = 0;
    cv::Rect region;                                  // form area on its page
    std::map<std::string, RatingCounts> counts;
    std::map<std::string, SubjectScore> scores;       // filled by the score pass
};

struct AggregationResult {
    std::map<std::string, RatingCounts> totals;
    std::vector<PerFormRecord> forms;                 // page order, then form order
    int pagesProcessed = 0;
};

struct AggregatorOptions {
    int expectedQuestions = 20;
    std::string debugDir;       // empty: no diagnostic images
    int workerThreads = 1;
    double minContrast = 2.0;
};

class FormAggregator {
public:
    FormAggregator(RatingScale ratings,
                   CalibrationTable calibration,
                   AggregatorOptions options = AggregatorOptions(),
                   FormSplitConfig splitConfig = FormSplitConfig());

    AggregationResult aggregate(const std::vector<cv::Mat>& pages, const Layout& layout) const;

    // Decodes every subject band inside one form region of a page
    PerFormRecord decodeForm(
        const cv::Mat& pageGray,
        int pageIndex,
        int formIndex,
        const cv::Rect& region,
        const Layout& layout
    ) const;

    // Adds a record's counts to the running per-subject totals
    static void fold(AggregationResult& result, const PerFormRecord& record);

private:
    RatingScale ratings_;
    CalibrationTable calibration_;
    AggregatorOptions options_;
    FormSplitter splitter_;
    BubbleDetector detector_;

    void writeDiagnostic(const cv::Mat& image, int pageIndex, int formIndex) const;
};

} // namespace omr

#endif // OMR_FORM_AGGREGATOR_HPP
