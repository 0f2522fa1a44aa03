#include <gtest/gtest.h>
#include "perspective_taper.h"
#include "test_helpers.h"

TEST(PerspectiveTaperTest, NarrowHundredIsNoOp) {
    cv::Mat img = solid_red(40, 30);
    cv::Mat out = apply_perspective_taper(img, WarpAxis::Vertical, 100.0, cv::Scalar(0, 0, 0, 0));
    EXPECT_EQ(out.data, img.data);
    EXPECT_DOUBLE_EQ(taper_offset(img.size(), WarpAxis::Vertical, 100.0), 0.0);
}

TEST(PerspectiveTaperTest, HorizontalCornersMoveInwardOnRightEdge) {
    const cv::Size size(200, 100);
    std::vector<cv::Point2f> quad = taper_corners(size, WarpAxis::Horizontal, 50.0);

    ASSERT_EQ(quad.size(), 4u);
    // height/2 * 0.5 = 25
    EXPECT_EQ(quad[0], cv::Point2f(0, 0));
    EXPECT_EQ(quad[1], cv::Point2f(200, 25));
    EXPECT_EQ(quad[2], cv::Point2f(200, 75));
    EXPECT_EQ(quad[3], cv::Point2f(0, 100));
}

TEST(PerspectiveTaperTest, VerticalCornersMoveInwardOnBottomEdge) {
    const cv::Size size(200, 100);
    std::vector<cv::Point2f> quad = taper_corners(size, WarpAxis::Vertical, 80.0);

    EXPECT_EQ(quad[0], cv::Point2f(0, 0));
    EXPECT_EQ(quad[1], cv::Point2f(200, 0));
    EXPECT_NEAR(quad[2].x, 180.0f, 1e-4);
    EXPECT_NEAR(quad[3].x, 20.0f, 1e-4);
    EXPECT_EQ(quad[2].y, 100.0f);
}

TEST(PerspectiveTaperTest, NarrowZeroCollapsesFarEdge) {
    const cv::Size size(200, 100);
    double offset = taper_offset(size, WarpAxis::Vertical, 0.0);
    EXPECT_NEAR(offset, 99.75, 1e-9);

    cv::Mat out = apply_perspective_taper(solid_red(200, 100), WarpAxis::Vertical, 0.0, cv::Scalar(0, 0, 0, 0));
    ASSERT_EQ(out.size(), size);
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(2, 100)));
    EXPECT_EQ(out.at<cv::Vec4b>(98, 20)[3], 0);
    EXPECT_EQ(out.at<cv::Vec4b>(98, 180)[3], 0);
}

TEST(PerspectiveTaperTest, TaperUsesBoundaryColour) {
    const cv::Scalar white(255, 255, 255, 255);
    cv::Mat out = apply_perspective_taper(solid_red(200, 100), WarpAxis::Vertical, 50.0, white);

    ASSERT_EQ(out.size(), cv::Size(200, 100));
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(50, 100)));
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(97, 100)));
    EXPECT_EQ(out.at<cv::Vec4b>(97, 5), cv::Vec4b(255, 255, 255, 255));
    EXPECT_EQ(out.at<cv::Vec4b>(97, 194), cv::Vec4b(255, 255, 255, 255));
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(2, 5)));
}
