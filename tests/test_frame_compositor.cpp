#include <gtest/gtest.h>
#include "cylinder_geometry.h"
#include "frame_compositor.h"
#include "test_helpers.h"

// ============================================
// Trim
// ============================================

TEST(TrimTest, CropsToOpaqueBoundingBox) {
    cv::Mat img = solid_image(100, 80, bgra(0, 0, 0, 0));
    img(cv::Rect(20, 30, 10, 5)).setTo(bgra(0, 0, 255));

    cv::Mat trimmed = FrameCompositor::trim_to_content(img, FillColor());
    EXPECT_EQ(trimmed.size(), cv::Size(10, 5));
    EXPECT_TRUE(is_red(trimmed.at<cv::Vec4b>(0, 0)));
}

TEST(TrimTest, TreatsFillColourAsBackground) {
    FillColor white = parse_color("white", "fcolor");
    cv::Mat img = solid_image(100, 80, white.bgra);
    img(cv::Rect(5, 6, 7, 8)).setTo(bgra(0, 0, 255));
    img(cv::Rect(60, 0, 10, 10)).setTo(bgra(0, 0, 0, 0));

    cv::Mat trimmed = FrameCompositor::trim_to_content(img, white);
    EXPECT_EQ(trimmed.size(), cv::Size(7, 8));
}

TEST(TrimTest, EmptyImageIsLeftAlone) {
    cv::Mat img = solid_image(30, 20, bgra(0, 0, 0, 0));
    cv::Mat trimmed = FrameCompositor::trim_to_content(img, FillColor());
    EXPECT_EQ(trimmed.size(), img.size());
}

// ============================================
// Centre crop
// ============================================

TEST(CropTest, KeepsOriginalWrapDimension) {
    CylinderGeometry g = GeometryResolver::resolve(scenario_params(), cv::Size(400, 600));
    cv::Mat img = solid_image(800, 600, bgra(0, 0, 0, 0));
    img(cv::Rect(200, 0, 400, 600)).setTo(bgra(0, 0, 255));

    cv::Mat framed = FrameCompositor::crop_to_frame(img, g);
    ASSERT_EQ(framed.size(), cv::Size(400, 600));
    EXPECT_TRUE(is_red(framed.at<cv::Vec4b>(0, 0)));
    EXPECT_TRUE(is_red(framed.at<cv::Vec4b>(599, 399)));
}

TEST(CropTest, HorizontalCropsRows) {
    CylinderParams params = scenario_params();
    params.axis = WarpAxis::Horizontal;
    CylinderGeometry g = GeometryResolver::resolve(params, cv::Size(600, 400));

    cv::Mat framed = FrameCompositor::crop_to_frame(solid_red(600, 800), g);
    EXPECT_EQ(framed.size(), cv::Size(600, 400));
}

// ============================================
// Composite
// ============================================

TEST(CompositeTest, CentersThenOffsets) {
    cv::Mat bg = solid_image(200, 100, bgra(255, 0, 0));
    cv::Mat fg = solid_red(20, 10);

    cv::Mat out = FrameCompositor::composite_over(fg, bg, cv::Point(24, 10));
    ASSERT_EQ(out.size(), bg.size());
    // 居中位置 (90, 45)，平移后 (114, 55)
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(55, 114)));
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(64, 133)));
    EXPECT_TRUE(is_blue(out.at<cv::Vec4b>(55, 113)));
    EXPECT_TRUE(is_blue(out.at<cv::Vec4b>(54, 114)));
    EXPECT_TRUE(is_blue(out.at<cv::Vec4b>(65, 133)));
    EXPECT_TRUE(is_blue(out.at<cv::Vec4b>(64, 134)));
}

TEST(CompositeTest, AlphaOver) {
    cv::Mat bg = solid_image(10, 10, bgra(255, 0, 0));
    cv::Mat fg = solid_image(10, 10, bgra(0, 0, 255, 128));

    cv::Mat out = FrameCompositor::composite_over(fg, bg, cv::Point(0, 0));
    cv::Vec4b px = out.at<cv::Vec4b>(5, 5);
    EXPECT_NEAR(px[0], 127, 1);
    EXPECT_NEAR(px[2], 128, 1);
    EXPECT_EQ(px[3], 255);
}

TEST(CompositeTest, TransparentForegroundKeepsBackground) {
    cv::Mat bg = solid_image(10, 10, bgra(10, 20, 30));
    cv::Mat fg = solid_image(4, 4, bgra(0, 0, 255, 0));

    cv::Mat out = FrameCompositor::composite_over(fg, bg, cv::Point(0, 0));
    EXPECT_EQ(out.at<cv::Vec4b>(5, 5), cv::Vec4b(10, 20, 30, 255));
}

TEST(CompositeTest, OffscreenForegroundIsClipped) {
    cv::Mat bg = solid_image(50, 50, bgra(255, 0, 0));
    cv::Mat out = FrameCompositor::composite_over(solid_red(10, 10), bg, cv::Point(200, 0));
    cv::Mat diff;
    cv::absdiff(out, bg, diff);
    EXPECT_EQ(cv::countNonZero(diff.reshape(1)), 0);

    // 部分越界只画可见部分
    out = FrameCompositor::composite_over(solid_red(10, 10), bg, cv::Point(-22, 0));
    EXPECT_TRUE(is_red(out.at<cv::Vec4b>(25, 0)));
    EXPECT_TRUE(is_blue(out.at<cv::Vec4b>(25, 10)));
}
