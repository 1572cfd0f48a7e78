#ifndef OMR_FORM_SPLITTER_HPP
#define OMR_FORM_SPLITTER_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace omr {

struct FormSplitConfig {
    int formsPerPage = 1;
    double gapPercentile = 10.0;   // rows at or below this density percentile are gap candidates
    int smoothingRows = 15;        // moving average window over the row profile
    double minGapFraction = 0.01;  // shortest accepted gap, as a fraction of page height
};

struct FormSplit {
    std::vector<cv::Rect> forms;   // full-width, top to bottom, covering every row once
    bool detected = false;         // false when the equal-slice fallback was used
};

// Splits a page holding several printed forms along blank horizontal gaps
class FormSplitter {
public:
    explicit FormSplitter(FormSplitConfig config = FormSplitConfig());

    FormSplit split(const cv::Mat& pageGray) const;

    // Smoothed fraction of ink pixels per row
    std::vector<double> rowInkDensity(const cv::Mat& pageGray) const;

    static std::vector<cv::Rect> equalSlices(const cv::Size& size, int count);

    const FormSplitConfig& config() const { return config_; }

private:
    struct Gap {
        int start;
        int end;   // exclusive
        int length() const { return end - start; }
    };

    FormSplitConfig config_;

    std::vector<Gap> findGaps(const std::vector<double>& density) const;
};

} // namespace omr

#endif // OMR_FORM_SPLITTER_HPP
