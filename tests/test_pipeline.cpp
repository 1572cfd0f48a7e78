/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests: document in, aggregated feedback out
 */

#include <gtest/gtest.h>

#include "SheetFixture.hpp"
#include "omr/Errors.hpp"
#include "omr/OmrPipeline.hpp"
#include "omr/ResultJson.hpp"

#include <opencv2/imgcodecs.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace omr;
using namespace omr_test;

namespace {

constexpr int kQuestions = 5;

std::vector<unsigned char> encodePng(const cv::Mat& img) {
    std::vector<unsigned char> buf;
    cv::imencode(".png", img, buf);
    return buf;
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        PipelineConfig cfg = defaultPipelineConfig();
        cfg.expectedQuestions = kQuestions;
        pipeline_ = std::make_unique<OmrPipeline>(cfg);

        request_.subjects = {"Physics", "English"};
        layout_ = LayoutResolver().resolve(request_.subjects, "");
    }

    cv::Mat sheet(const RatingCounts& physics, const RatingCounts& english) const {
        cv::Mat page = blankPage();
        drawForm(page, cv::Rect(0, 0, page.cols, page.rows), layout_,
                 {{"Physics", marksFromCounts(physics, kQuestions)},
                  {"English", marksFromCounts(english, kQuestions)}},
                 kQuestions);
        return page;
    }

    std::unique_ptr<OmrPipeline> pipeline_;
    OmrRequest request_;
    Layout layout_;
};

TEST_F(PipelineTest, AggregatesAndScoresAllPages) {
    std::vector<cv::Mat> pages = {sheet(RatingCounts{5, 0, 0}, RatingCounts{0, 0, 5}),
                                  sheet(RatingCounts{3, 2, 0}, RatingCounts{1, 1, 1})};

    PipelineResult r = pipeline_->runOnPages(pages, request_);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.pageCount, 2);
    EXPECT_EQ(r.responses, 2);
    EXPECT_EQ(r.layoutSource, LayoutSource::Explicit);
    EXPECT_EQ(r.subjects, (std::vector<std::string>{"Physics", "English"}));

    EXPECT_EQ(r.totals.at("Physics"), (RatingCounts{8, 2, 0}));
    EXPECT_EQ(r.totals.at("English"), (RatingCounts{1, 1, 6}));

    // Physics: (40 + 6) / (2 * 5 * 5)
    EXPECT_DOUBLE_EQ(r.scores.at("Physics").percentage, 92.0);
    EXPECT_EQ(r.scores.at("Physics").verdict.label, "Pass");
    // English: (5 + 3 + 6) / 50
    EXPECT_DOUBLE_EQ(r.scores.at("English").percentage, 28.0);
    EXPECT_EQ(r.scores.at("English").verdict.label, "Fail");

    ASSERT_EQ(r.forms.size(), 2u);
    EXPECT_DOUBLE_EQ(r.forms[0].scores.at("Physics").percentage, 100.0);
}

TEST_F(PipelineTest, RespondentCountNormalizes) {
    PipelineConfig cfg = pipeline_->config();
    cfg.scoring.mode = NormalizationMode::Respondents;
    OmrPipeline pipeline(cfg);

    request_.respondents = 4;
    std::vector<cv::Mat> pages = {sheet(RatingCounts{5, 0, 0}, RatingCounts{})};
    PipelineResult r = pipeline.runOnPages(pages, request_);

    EXPECT_EQ(r.responses, 4);
    EXPECT_EQ(r.scores.at("Physics").maxScore, 100);
    EXPECT_DOUBLE_EQ(r.scores.at("Physics").percentage, 25.0);
}

TEST_F(PipelineTest, RunsOnImageBytes) {
    request_.document.bytes = encodePng(sheet(RatingCounts{1, 2, 2}, RatingCounts{0, 5, 0}));
    PipelineResult r = pipeline_->run(request_);

    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.pageCount, 1);
    EXPECT_EQ(r.totals.at("Physics"), (RatingCounts{1, 2, 2}));
    EXPECT_EQ(r.totals.at("English"), (RatingCounts{0, 5, 0}));
}

TEST_F(PipelineTest, BlankSheetScoresZero) {
    request_.document.bytes = encodePng(blankPage());
    PipelineResult r = pipeline_->run(request_);

    ASSERT_TRUE(r.ok());
    for (const auto& subject : r.subjects) {
        EXPECT_EQ(r.totals.at(subject).total(), 0);
        EXPECT_DOUBLE_EQ(r.scores.at(subject).percentage, 0.0);
    }
}

TEST_F(PipelineTest, UnreadableDocumentIsLoadFailed) {
    request_.document.bytes = {'n', 'o', 'p', 'e'};
    PipelineResult r = pipeline_->run(request_);

    EXPECT_EQ(r.status, RunStatus::LoadFailed);
    EXPECT_FALSE(r.message.empty());
    EXPECT_TRUE(r.totals.empty());
    EXPECT_TRUE(r.forms.empty());
    EXPECT_EQ(r.pageCount, 0);
}

TEST_F(PipelineTest, MissingFileIsLoadFailed) {
    request_.document.path = "/nonexistent/feedback.pdf";
    EXPECT_EQ(pipeline_->run(request_).status, RunStatus::LoadFailed);
}

TEST_F(PipelineTest, NoPagesIsLoadFailed) {
    EXPECT_EQ(pipeline_->runOnPages({}, request_).status, RunStatus::LoadFailed);
}

TEST_F(PipelineTest, NoSubjectsAndNoPhaseThrows) {
    request_.subjects.clear();
    request_.document.bytes = encodePng(blankPage());
    EXPECT_THROW(pipeline_->run(request_), LayoutError);
}

TEST_F(PipelineTest, PhaseCodeSelectsSubjects) {
    request_.subjects.clear();
    request_.phase = "12 NEET";
    request_.document.bytes = encodePng(blankPage());

    PipelineResult r = pipeline_->run(request_);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.layoutSource, LayoutSource::Phase);
    EXPECT_EQ(r.subjects, (std::vector<std::string>{"Physics", "Chemistry", "Botany", "Zoology", "English"}));
    EXPECT_EQ(r.totals.size(), 5u);
}

TEST_F(PipelineTest, RequestOverridesConfig) {
    request_.formsPerPage = 2;
    request_.expectedQuestions = 10;

    PipelineResult r = pipeline_->runOnPages({blankPage()}, request_);
    EXPECT_EQ(r.forms.size(), 2u);
    EXPECT_EQ(r.expectedQuestions, 10);
    EXPECT_EQ(r.responses, 2);

    request_.expectedQuestions = 0;
    EXPECT_THROW(pipeline_->runOnPages({blankPage()}, request_), ConfigError);
}

TEST_F(PipelineTest, WritesDiagnosticsWhenRequested) {
    std::filesystem::path dir = makeTempDir("pipeline");
    request_.debugDir = dir.string();

    pipeline_->runOnPages({sheet(RatingCounts{1, 0, 0}, RatingCounts{})}, request_);
    EXPECT_TRUE(std::filesystem::exists(dir / "page_1_form_1.png"));

    std::filesystem::remove_all(dir);
}

TEST_F(PipelineTest, InvalidConfigIsRejected) {
    PipelineConfig cfg = defaultPipelineConfig();
    cfg.layout.columnsX = {0.5};
    EXPECT_THROW(OmrPipeline{cfg}, ConfigError);
}

TEST_F(PipelineTest, ResultSerializesToJson) {
    std::vector<cv::Mat> pages = {sheet(RatingCounts{2, 1, 0}, RatingCounts{0, 0, 1})};
    PipelineResult r = pipeline_->runOnPages(pages, request_);

    nlohmann::json j = nlohmann::json::parse(resultToJson(r));
    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["page_count"], 1);
    EXPECT_EQ(j["layout_source"], "explicit");
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["subject"], "Physics");
    EXPECT_EQ(j["results"][0]["counts"]["5_star"], 2);
    EXPECT_EQ(j["results"][0]["counts"]["3_star"], 1);
    EXPECT_EQ(j["results"][1]["counts"]["1_star"], 1);
    EXPECT_EQ(j["forms"][0]["page"], 1);

    PipelineResult failed;
    failed.status = RunStatus::LoadFailed;
    failed.message = "Load error: empty document buffer";
    EXPECT_EQ(nlohmann::json::parse(resultToJson(failed))["status"], "load_failed");
}

TEST_F(PipelineTest, NonUtf8NamesSerialize) {
    request_.subjects = {"Fran\xE7" "ais"};
    PipelineResult r = pipeline_->runOnPages({blankPage()}, request_);
    ASSERT_TRUE(r.ok());

    std::string text;
    ASSERT_NO_THROW(text = resultToJson(r));
    nlohmann::json j = nlohmann::json::parse(text);
    ASSERT_EQ(j["subjects"].size(), 1u);
    std::string name = j["subjects"][0].get<std::string>();
    EXPECT_EQ(name.rfind("Fran", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 3), "ais");
    EXPECT_EQ(j["results"][0]["counts"]["5_star"], 0);

    PipelineResult failed;
    failed.status = RunStatus::LoadFailed;
    failed.message = "Load error: cannot open document /scans/r\xE9sum\xE9.pdf";
    EXPECT_NO_THROW(resultToJson(failed));

    std::filesystem::path dir = makeTempDir("json");
    EXPECT_TRUE(writeResultJson(r, (dir / "result.json").string()));
    EXPECT_TRUE(std::filesystem::exists(dir / "result.json"));
    std::filesystem::remove_all(dir);
}

TEST_F(PipelineTest, PdfBytesRunEveryPage) {
    request_.document.bytes = twoPagePdf();
    ASSERT_TRUE(request_.document.fromBytes());

    PipelineResult r = pipeline_->run(request_);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.pageCount, 2);
    ASSERT_EQ(r.forms.size(), 2u);
    EXPECT_EQ(r.forms[0].pageIndex, 0);
    EXPECT_EQ(r.forms[1].pageIndex, 1);

    // the strips sit above and below the subject bands
    for (const auto& subject : r.subjects) {
        EXPECT_EQ(r.totals.at(subject).total(), 0) << subject;
    }
}
