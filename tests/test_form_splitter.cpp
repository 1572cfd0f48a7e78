/**
 * @file test_form_splitter.cpp
 * @brief Unit tests for splitting a page into its printed forms
 */

#include <gtest/gtest.h>

#include "SheetFixture.hpp"
#include "omr/FormSplitter.hpp"

#include <opencv2/imgproc.hpp>

using namespace omr;
using namespace omr_test;

namespace {

FormSplitConfig splitInto(int forms) {
    FormSplitConfig cfg;
    cfg.formsPerPage = forms;
    return cfg;
}

// Checks that the forms tile the page top to bottom
void expectPartition(const std::vector<cv::Rect>& forms, const cv::Size& page) {
    ASSERT_FALSE(forms.empty());
    EXPECT_EQ(forms.front().y, 0);
    for (size_t i = 0; i < forms.size(); ++i) {
        EXPECT_EQ(forms[i].x, 0);
        EXPECT_EQ(forms[i].width, page.width);
        EXPECT_GT(forms[i].height, 0);
        if (i + 1 < forms.size()) {
            EXPECT_EQ(forms[i].y + forms[i].height, forms[i + 1].y);
        }
    }
    EXPECT_EQ(forms.back().y + forms.back().height, page.height);
}

} // namespace

TEST(FormSplitterTest, SingleFormIsWholePage) {
    FormSplitter splitter(splitInto(1));
    cv::Mat page = blankPage();
    FormSplit s = splitter.split(page);
    ASSERT_EQ(s.forms.size(), 1u);
    EXPECT_EQ(s.forms[0], cv::Rect(0, 0, kPageWidth, kPageHeight));
}

TEST(FormSplitterTest, NoBoundaryFallsBackToEqualSlices) {
    FormSplitter splitter(splitInto(2));
    cv::Mat page = blankPage();

    FormSplit s = splitter.split(page);
    EXPECT_FALSE(s.detected);
    ASSERT_EQ(s.forms.size(), 2u);
    EXPECT_EQ(s.forms[0], cv::Rect(0, 0, kPageWidth, 700));
    EXPECT_EQ(s.forms[1], cv::Rect(0, 700, kPageWidth, 700));
    expectPartition(s.forms, page.size());
}

TEST(FormSplitterTest, InkEverywhereFallsBack) {
    FormSplitter splitter(splitInto(3));
    cv::Mat page = blankPage();
    // evenly spaced thin rules, no row band clearly emptier than the others
    for (int y = 0; y < page.rows; y += 4) {
        cv::line(page, cv::Point(0, y), cv::Point(page.cols - 1, y), cv::Scalar(0), 1);
    }

    FormSplit s = splitter.split(page);
    EXPECT_FALSE(s.detected);
    ASSERT_EQ(s.forms.size(), 3u);
    expectPartition(s.forms, page.size());
}

TEST(FormSplitterTest, DetectsBlankGapBetweenForms) {
    FormSplitter splitter(splitInto(2));
    cv::Mat page = blankPage();
    cv::rectangle(page, cv::Rect(100, 100, 800, 500), cv::Scalar(0), cv::FILLED);
    cv::rectangle(page, cv::Rect(100, 800, 800, 500), cv::Scalar(0), cv::FILLED);

    FormSplit s = splitter.split(page);
    EXPECT_TRUE(s.detected);
    ASSERT_EQ(s.forms.size(), 2u);
    int cut = s.forms[1].y;
    EXPECT_GT(cut, 600);
    EXPECT_LT(cut, 800);
    expectPartition(s.forms, page.size());
}

TEST(FormSplitterTest, PicksWidestGaps) {
    FormSplitter splitter(splitInto(2));
    cv::Mat page = blankPage();
    // narrow gap at 350-390, wide gap at 700-900
    cv::rectangle(page, cv::Rect(100, 100, 800, 250), cv::Scalar(0), cv::FILLED);
    cv::rectangle(page, cv::Rect(100, 390, 800, 310), cv::Scalar(0), cv::FILLED);
    cv::rectangle(page, cv::Rect(100, 900, 800, 400), cv::Scalar(0), cv::FILLED);

    FormSplit s = splitter.split(page);
    EXPECT_TRUE(s.detected);
    ASSERT_EQ(s.forms.size(), 2u);
    EXPECT_GT(s.forms[1].y, 700);
    EXPECT_LT(s.forms[1].y, 900);
}

TEST(FormSplitterTest, EqualSlicesCoverOddHeights) {
    auto slices = FormSplitter::equalSlices(cv::Size(50, 301), 3);
    ASSERT_EQ(slices.size(), 3u);
    expectPartition(slices, cv::Size(50, 301));
}

TEST(FormSplitterTest, RowDensityOfBlankPageIsZero) {
    FormSplitter splitter(splitInto(2));
    auto density = splitter.rowInkDensity(blankPage());
    ASSERT_EQ(density.size(), static_cast<size_t>(kPageHeight));
    for (double d : density) EXPECT_DOUBLE_EQ(d, 0.0);
}
