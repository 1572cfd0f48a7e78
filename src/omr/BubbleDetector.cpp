#include "omr/BubbleDetector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace omr {

BubbleDetector::BubbleDetector(double minContrast)
    : minContrast_(minContrast)
{
}

cv::Mat BubbleDetector::buildInkMask(const cv::Mat& bandGray, bool enhance) const {
    cv::Mat equalized;
    cv::equalizeHist(bandGray, equalized);

    cv::Mat globalBin, adaptiveBin;
    cv::threshold(equalized, globalBin, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    cv::adaptiveThreshold(equalized, adaptiveBin, 255,
                          cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 21, 5);

    cv::Mat ink;
    cv::bitwise_or(globalBin, adaptiveBin, ink);
    cv::medianBlur(ink, ink, 3);

    if (enhance) {
        cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3));
        cv::morphologyEx(ink, ink, cv::MORPH_CLOSE, kernel);
    }
    return ink;
}

int BubbleDetector::largestComponentArea(const cv::Mat& region) const {
    if (region.empty()) return 0;

    cv::Mat labels, stats, centroids;
    int n = cv::connectedComponentsWithStats(region.clone(), labels, stats, centroids, 8, CV_32S);

    int best = 0;
    // label 0 is background
    for (int i = 1; i < n; ++i) {
        best = std::max(best, stats.at<int>(i, cv::CC_STAT_AREA));
    }
    return best;
}

cv::Rect BubbleDetector::slotWindow(int columnX, int slotTop, int slotBottom,
                                    int bandWidth, int windowSize) const {
    int half = windowSize / 2;
    int centerY = (slotTop + slotBottom) / 2;
    cv::Rect window(columnX - half, centerY - half, windowSize, windowSize);
    // windows never reach into the neighbouring question rows
    return window & cv::Rect(0, slotTop, bandWidth, slotBottom - slotTop);
}

BandDecodeResult BubbleDetector::decodeBand(
    const cv::Mat& pageGray,
    int yStart,
    int yEnd,
    const std::vector<int>& columnsX,
    const RatingScale& ratings,
    int expectedQuestions,
    const SubjectCalibration& calib,
    cv::Mat* debugVis) const
{
    BandDecodeResult result;
    result.counts = RatingCounts(ratings.size());

    if (pageGray.empty() || expectedQuestions <= 0 || ratings.empty()) return result;

    int y0 = std::clamp(yStart, 0, pageGray.rows);
    int y1 = std::clamp(yEnd, 0, pageGray.rows);
    if (y1 - y0 <= 0) return result;

    result.slotRatings.assign(expectedQuestions, -1);
    result.slotAreas.assign(expectedQuestions, 0);

    cv::Rect bandRect(0, y0, pageGray.cols, y1 - y0);
    cv::Mat band = pageGray(bandRect);

    cv::Scalar mean, stddev;
    cv::meanStdDev(band, mean, stddev);
    bool blank = stddev[0] < minContrast_;

    size_t cols = std::min(columnsX.size(), ratings.size());

    if (!blank && cols > 0) {
        cv::Mat ink = buildInkMask(band, calib.enhance);
        double slotH = static_cast<double>(band.rows) / expectedQuestions;

        for (int q = 0; q < expectedQuestions; ++q) {
            int top = static_cast<int>(std::lround(q * slotH));
            int bottom = static_cast<int>(std::lround((q + 1) * slotH));
            if (bottom - top <= 0) continue;

            int bestArea = 0;
            int bestIdx = -1;

            for (size_t c = 0; c < cols; ++c) {
                cv::Rect window = slotWindow(columnsX[c], top, bottom, band.cols, calib.windowSize);
                if (window.width <= 0 || window.height <= 0) continue;

                int area = largestComponentArea(ink(window));
                if (area <= calib.minArea) continue;

                // strict comparison keeps the first column on ties
                if (area > bestArea) {
                    bestArea = area;
                    bestIdx = static_cast<int>(c);
                }
            }

            if (bestIdx >= 0) {
                result.slotRatings[q] = bestIdx;
                result.slotAreas[q] = bestArea;
                result.counts.increment(static_cast<size_t>(bestIdx));
            }
        }
    }

    if (debugVis && !debugVis->empty() && debugVis->size() == pageGray.size()) {
        drawBandDebug(*debugVis, bandRect, columnsX, result, calib.windowSize, "");
    }

    return result;
}

void BubbleDetector::drawBandDebug(
    cv::Mat& debugImg,
    const cv::Rect& band,
    const std::vector<int>& columnsX,
    const BandDecodeResult& result,
    int windowSize,
    const std::string& label) const
{
    cv::Rect safeBand = band & cv::Rect(0, 0, debugImg.cols, debugImg.rows);
    if (safeBand.area() <= 0) return;

    cv::Mat debugSub = debugImg(safeBand);
    cv::rectangle(debugSub, cv::Rect(0, 0, safeBand.width, safeBand.height),
                  cv::Scalar(255, 128, 0), 1);

    if (!label.empty()) {
        cv::putText(debugSub, label, cv::Point(5, 15),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 128, 0), 1);
    }

    int rows = static_cast<int>(result.slotRatings.size());
    if (rows == 0) return;
    double slotH = static_cast<double>(safeBand.height) / rows;

    for (int q = 0; q < rows; ++q) {
        int top = static_cast<int>(std::lround(q * slotH));
        int bottom = static_cast<int>(std::lround((q + 1) * slotH));
        int selected = result.slotRatings[q];

        for (size_t c = 0; c < columnsX.size(); ++c) {
            cv::Rect window = slotWindow(columnsX[c], top, bottom, safeBand.width, windowSize);
            if (window.area() <= 0) continue;

            if (static_cast<int>(c) == selected) {
                cv::rectangle(debugSub, window, cv::Scalar(0, 255, 0), 2);
                cv::putText(debugSub, std::to_string(result.slotAreas[q]),
                            cv::Point(window.x + window.width + 2, window.y + window.height / 2 + 4),
                            cv::FONT_HERSHEY_SIMPLEX, 0.35, cv::Scalar(0, 255, 0), 1);
            } else {
                cv::Point center(window.x + window.width / 2, window.y + window.height / 2);
                int radius = std::min(window.width, window.height) * 35 / 100;
                cv::circle(debugSub, center, radius, cv::Scalar(100, 100, 100), 1, cv::LINE_AA);
            }
        }
    }
}

} // namespace omr
