#include "omr/FormSplitter.hpp"
#include "omr/Logger.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace omr {

FormSplitter::FormSplitter(FormSplitConfig config)
    : config_(config) {}

std::vector<cv::Rect> FormSplitter::equalSlices(const cv::Size& size, int count) {
    std::vector<cv::Rect> slices;
    if (count < 1) count = 1;
    for (int i = 0; i < count; ++i) {
        int top = static_cast<int>(static_cast<long long>(i) * size.height / count);
        int bottom = static_cast<int>(static_cast<long long>(i + 1) * size.height / count);
        slices.emplace_back(0, top, size.width, bottom - top);
    }
    return slices;
}

std::vector<double> FormSplitter::rowInkDensity(const cv::Mat& pageGray) const {
    std::vector<double> density(pageGray.rows, 0.0);
    if (pageGray.empty()) return density;

    cv::Scalar mean, stddev;
    cv::meanStdDev(pageGray, mean, stddev);
    if (stddev[0] < 1.0) return density;   // uniform page, nothing printed

    cv::Mat ink;
    cv::threshold(pageGray, ink, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

    cv::Mat rowSums;
    cv::reduce(ink, rowSums, 1, cv::REDUCE_SUM, CV_64F);
    rowSums /= (255.0 * pageGray.cols);

    cv::Mat smoothed;
    int k = std::max(1, config_.smoothingRows);
    cv::blur(rowSums, smoothed, cv::Size(1, k), cv::Point(-1, -1), cv::BORDER_REPLICATE);

    for (int r = 0; r < smoothed.rows; ++r) {
        density[r] = smoothed.at<double>(r, 0);
    }
    return density;
}

std::vector<FormSplitter::Gap> FormSplitter::findGaps(const std::vector<double>& density) const {
    std::vector<Gap> gaps;
    const int n = static_cast<int>(density.size());
    if (n == 0) return gaps;

    std::vector<double> sorted = density;
    std::sort(sorted.begin(), sorted.end());
    double p = std::clamp(config_.gapPercentile, 0.0, 100.0) / 100.0;
    double threshold = sorted[static_cast<size_t>(std::floor(p * (n - 1)))];

    int minLen = std::max(1, static_cast<int>(std::lround(config_.minGapFraction * n)));

    int r = 0;
    while (r < n) {
        if (density[r] > threshold) {
            ++r;
            continue;
        }
        int start = r;
        while (r < n && density[r] <= threshold) ++r;
        Gap gap{start, r};

        // margins touching the page edge do not separate two forms
        bool internal = gap.start > 0 && gap.end < n;
        if (internal && gap.length() >= minLen) gaps.push_back(gap);
    }
    return gaps;
}

FormSplit FormSplitter::split(const cv::Mat& pageGray) const {
    FormSplit out;
    const int count = std::max(1, config_.formsPerPage);
    const cv::Size size = pageGray.size();

    if (count == 1) {
        out.forms.emplace_back(0, 0, size.width, size.height);
        out.detected = true;
        return out;
    }

    std::vector<Gap> gaps = findGaps(rowInkDensity(pageGray));

    if (static_cast<int>(gaps.size()) < count - 1) {
        logDebug("Form split: found " + std::to_string(gaps.size()) + " gap(s), need "
                 + std::to_string(count - 1) + ", slicing page evenly");
        out.forms = equalSlices(size, count);
        out.detected = false;
        return out;
    }

    // widest gaps first, earlier gap wins a tie
    std::stable_sort(gaps.begin(), gaps.end(),
                     [](const Gap& a, const Gap& b) { return a.length() > b.length(); });
    gaps.resize(count - 1);
    std::sort(gaps.begin(), gaps.end(),
              [](const Gap& a, const Gap& b) { return a.start < b.start; });

    int top = 0;
    for (const auto& g : gaps) {
        int cut = (g.start + g.end) / 2;
        out.forms.emplace_back(0, top, size.width, cut - top);
        top = cut;
    }
    out.forms.emplace_back(0, top, size.width, size.height - top);
    out.detected = true;
    return out;
}

} // namespace omr
