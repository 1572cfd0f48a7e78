#include "omr/FormAggregator.hpp"
#include "omr/Logger.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <future>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace omr {

namespace {

struct FormJob {
    int pageIndex;
    int formIndex;
    cv::Rect region;
};

int toPixel(double frac, int extent) {
    return static_cast<int>(std::lround(frac * extent));
}

std::string countsToString(const RatingScale& ratings, const RatingCounts& counts) {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < ratings.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ratings[i].key << ": " << counts.at(i);
    }
    oss << "}";
    return oss.str();
}

} // namespace

FormAggregator::FormAggregator(RatingScale ratings,
                               CalibrationTable calibration,
                               AggregatorOptions options,
                               FormSplitConfig splitConfig)
    : ratings_(std::move(ratings)),
      calibration_(std::move(calibration)),
      options_(std::move(options)),
      splitter_(splitConfig),
      detector_(options_.minContrast) {}

PerFormRecord FormAggregator::decodeForm(
    const cv::Mat& pageGray,
    int pageIndex,
    int formIndex,
    const cv::Rect& region,
    const Layout& layout) const
{
    PerFormRecord record;
    record.pageIndex = pageIndex;
    record.formIndex = formIndex;
    record.region = region & cv::Rect(0, 0, pageGray.cols, pageGray.rows);

    for (const auto& band : layout.bands) {
        record.counts[band.subject] = RatingCounts(ratings_.size());
    }
    if (record.region.area() <= 0) return record;

    cv::Mat form = pageGray(record.region);

    cv::Mat debugVis;
    bool wantDebug = !options_.debugDir.empty();
    if (wantDebug) cv::cvtColor(form, debugVis, cv::COLOR_GRAY2BGR);

    for (const auto& band : layout.bands) {
        int yStart = toPixel(band.yStartFrac, form.rows);
        int yEnd = toPixel(band.yEndFrac, form.rows);

        std::vector<int> columns;
        columns.reserve(band.columnsX.size());
        for (double x : band.columnsX) columns.push_back(toPixel(x, form.cols));

        const SubjectCalibration& calib = calibration_.lookup(band.subject);
        BandDecodeResult decoded = detector_.decodeBand(
            form, yStart, yEnd, columns, ratings_, options_.expectedQuestions, calib,
            wantDebug ? &debugVis : nullptr);

        record.counts[band.subject] = decoded.counts;

        if (wantDebug) {
            cv::putText(debugVis, band.subject, cv::Point(5, std::max(12, yStart + 12)),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 128, 0), 1);
        }
    }

    if (wantDebug) writeDiagnostic(debugVis, pageIndex, formIndex);
    return record;
}

void FormAggregator::fold(AggregationResult& result, const PerFormRecord& record) {
    for (const auto& entry : record.counts) {
        result.totals[entry.first] += entry.second;
    }
}

AggregationResult FormAggregator::aggregate(const std::vector<cv::Mat>& pages,
                                            const Layout& layout) const {
    AggregationResult result;
    for (const auto& band : layout.bands) {
        result.totals[band.subject] = RatingCounts(ratings_.size());
    }

    std::vector<FormJob> jobs;
    for (size_t p = 0; p < pages.size(); ++p) {
        FormSplit split = splitter_.split(pages[p]);
        if (splitter_.config().formsPerPage > 1) {
            logDebug("Page " + std::to_string(p + 1) + ": " + std::to_string(split.forms.size())
                     + " form(s), " + (split.detected ? "gaps detected" : "equal slices"));
        }
        for (size_t f = 0; f < split.forms.size(); ++f) {
            jobs.push_back({static_cast<int>(p), static_cast<int>(f), split.forms[f]});
        }
    }

    std::vector<PerFormRecord> records;
    records.reserve(jobs.size());

    if (options_.workerThreads > 1 && jobs.size() > 1) {
        size_t batch = static_cast<size_t>(options_.workerThreads);
        for (size_t i = 0; i < jobs.size(); i += batch) {
            std::vector<std::future<PerFormRecord>> pending;
            for (size_t j = i; j < std::min(jobs.size(), i + batch); ++j) {
                const FormJob& job = jobs[j];
                pending.push_back(std::async(std::launch::async, [this, &pages, &layout, job]() {
                    return decodeForm(pages[job.pageIndex], job.pageIndex, job.formIndex,
                                      job.region, layout);
                }));
            }
            for (auto& fut : pending) records.push_back(fut.get());
        }
        std::sort(records.begin(), records.end(),
                  [](const PerFormRecord& a, const PerFormRecord& b) {
                      if (a.pageIndex != b.pageIndex) return a.pageIndex < b.pageIndex;
                      return a.formIndex < b.formIndex;
                  });
    } else {
        for (const auto& job : jobs) {
            records.push_back(decodeForm(pages[job.pageIndex], job.pageIndex, job.formIndex,
                                         job.region, layout));
        }
    }

    for (const auto& record : records) {
        fold(result, record);
    }

    result.forms = std::move(records);
    result.pagesProcessed = static_cast<int>(pages.size());

    for (const auto& band : layout.bands) {
        logInfo("Totals " + band.subject + ": " + countsToString(ratings_, result.totals[band.subject]));
    }
    return result;
}

void FormAggregator::writeDiagnostic(const cv::Mat& image, int pageIndex, int formIndex) const {
    fs::path dir(options_.debugDir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        logWarning("Cannot create debug directory " + dir.string() + ": " + ec.message());
        return;
    }

    fs::path file = dir / ("page_" + std::to_string(pageIndex + 1) + "_form_"
                           + std::to_string(formIndex + 1) + ".png");
    try {
        if (!cv::imwrite(file.string(), image)) {
            logWarning("Could not write diagnostic image " + file.string());
        }
    } catch (const cv::Exception& e) {
        logWarning("Could not write diagnostic image " + file.string() + ": " + e.what());
    }
}

} // namespace omr
