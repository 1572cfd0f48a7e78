#ifndef OMR_BUBBLE_DETECTOR_HPP
#define OMR_BUBBLE_DETECTOR_HPP

#include "omr/CalibrationTable.hpp"
#include "omr/Types.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace omr {

struct BandDecodeResult {
    RatingCounts counts;
    std::vector<int> slotRatings;   // rating index per question slot, -1 if blank
    std::vector<int> slotAreas;     // winning component area per slot, 0 if blank
};

// Decodes one subject band: which rating bubble is marked in every question row
class BubbleDetector {
public:
    explicit BubbleDetector(double minContrast = 2.0);

    // pageGray is single channel; yStart/yEnd and columnsX are pixel
    // coordinates in it. A degenerate band yields all-zero counts. When
    // debugVis is a BGR image of the same size the decisions are drawn on it.
    BandDecodeResult decodeBand(
        const cv::Mat& pageGray,
        int yStart,
        int yEnd,
        const std::vector<int>& columnsX,
        const RatingScale& ratings,
        int expectedQuestions,
        const SubjectCalibration& calib,
        cv::Mat* debugVis = nullptr
    ) const;

    // Otsu OR adaptive threshold, median filtered. Ink is 255.
    cv::Mat buildInkMask(const cv::Mat& bandGray, bool enhance) const;

    void drawBandDebug(
        cv::Mat& debugImg,
        const cv::Rect& band,
        const std::vector<int>& columnsX,
        const BandDecodeResult& result,
        int windowSize,
        const std::string& label
    ) const;

    void setMinContrast(double c) { minContrast_ = c; }
    double getMinContrast() const { return minContrast_; }

private:
    double minContrast_;   // bands with a lower gray stddev carry no ink

    int largestComponentArea(const cv::Mat& region) const;
    cv::Rect slotWindow(int columnX, int slotTop, int slotBottom, int bandWidth, int windowSize) const;
};

} // namespace omr

#endif // OMR_BUBBLE_DETECTOR_HPP
