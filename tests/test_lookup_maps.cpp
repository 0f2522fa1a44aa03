#include <gtest/gtest.h>
#include "cylinder_geometry.h"
#include "lookup_maps.h"
#include "test_helpers.h"
#include <cmath>
#include <stdexcept>

static CylinderGeometry scenario_geometry(double pitch = 0.0, double exaggeration = 1.0) {
    CylinderParams params = scenario_params();
    params.pitch = pitch;
    params.exaggeration = exaggeration;
    return GeometryResolver::resolve(params, cv::Size(400, 600));
}

// ============================================
// Angle map
// ============================================

TEST(AngleMapTest, LengthMatchesProjectDimension) {
    CylinderGeometry g = scenario_geometry();
    EXPECT_EQ(static_cast<int>(build_angle_map(g).size()), 800);
}

TEST(AngleMapTest, CenterSamplesMidpoint) {
    std::vector<float> map = build_angle_map(scenario_geometry());
    EXPECT_FLOAT_EQ(map[400], 0.5f);
}

TEST(AngleMapTest, OutsideSilhouetteClampsToOne) {
    std::vector<float> map = build_angle_map(scenario_geometry());
    EXPECT_FLOAT_EQ(map[0], 1.0f);
    EXPECT_FLOAT_EQ(map[299], 1.0f);
    EXPECT_FLOAT_EQ(map[501], 1.0f);
    EXPECT_FLOAT_EQ(map[799], 1.0f);
}

TEST(AngleMapTest, ArcsineFormulaInsideSilhouette) {
    CylinderGeometry g = scenario_geometry();
    std::vector<float> map = build_angle_map(g);
    for (int i = 300; i <= 500; i += 25) {
        double xd = (i - g.center) / g.radius;
        double expected = 0.5 * (std::asin(xd) / CV_PI + (g.center - i) / g.center) + 0.5;
        EXPECT_NEAR(map[i], expected, 1e-6) << "i=" << i;
    }
    // 轮廓边缘：0.5 * (-0.5 + 0.25) + 0.5
    EXPECT_NEAR(map[300], 0.375, 1e-6);
}

TEST(AngleMapTest, SymmetricAboutCenter) {
    std::vector<float> map = build_angle_map(scenario_geometry());
    for (int k = 0; k <= 100; k += 10) {
        EXPECT_NEAR(map[400 + k] + map[400 - k], 1.0f, 1e-5) << "k=" << k;
    }
}

TEST(AngleMapTest, ValuesStayInUnitRange) {
    CylinderParams params = scenario_params();
    params.wrap = 100.0;
    params.radius = 190.0;
    std::vector<float> map = build_angle_map(GeometryResolver::resolve(params, cv::Size(400, 600)));
    for (float v : map) {
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 1.0f);
    }
}

// ============================================
// Curvature map
// ============================================

TEST(CurvatureMapTest, CircleProfile) {
    CylinderGeometry g = scenario_geometry();
    std::vector<float> map = build_curvature_map(g);

    ASSERT_EQ(static_cast<int>(map.size()), 800);
    EXPECT_FLOAT_EQ(map[400], 0.0f);
    EXPECT_NEAR(map[300], 0.5f, 1e-6);
    EXPECT_NEAR(map[500], 0.5f, 1e-6);
    EXPECT_FLOAT_EQ(map[100], 0.5f);
    EXPECT_FLOAT_EQ(map[700], 0.5f);

    double xd = 0.5;
    EXPECT_NEAR(map[450], 0.5 * (-std::sqrt(1.0 - xd * xd)) + 0.5, 1e-6);
    EXPECT_NEAR(map[350], map[450], 1e-6);
}

TEST(CurvatureFieldTest, NoTiltGivesConstantMidline) {
    CylinderGeometry g = scenario_geometry(0.0, 3.0);
    cv::Mat field = build_curvature_field(g, build_curvature_map(g));

    ASSERT_EQ(field.size(), g.canvas_size());
    double lo = 0, hi = 0;
    cv::minMaxLoc(field, &lo, &hi);
    EXPECT_DOUBLE_EQ(lo, 0.5);
    EXPECT_DOUBLE_EQ(hi, 0.5);
}

TEST(CurvatureFieldTest, UnexaggeratedFieldRepeatsProfile) {
    CylinderGeometry g = scenario_geometry(30.0, 1.0);
    std::vector<float> map = build_curvature_map(g);
    cv::Mat field = build_curvature_field(g, map);

    ASSERT_EQ(field.size(), g.canvas_size());
    for (int y = 0; y < field.rows; y += field.rows / 4) {
        EXPECT_FLOAT_EQ(field.at<float>(y, 400), map[400]);
        EXPECT_FLOAT_EQ(field.at<float>(y, 450), map[450]);
    }
}

TEST(CurvatureFieldTest, ExaggerationCompressesFarEnd) {
    CylinderGeometry g = scenario_geometry(30.0, 2.0);
    cv::Mat field = build_curvature_field(g, build_curvature_map(g));

    // 正俯仰角：第一行为远端，按 100/2 = 50% 向 0.5 压缩
    EXPECT_NEAR(field.at<float>(0, 400), 0.25f, 1e-6);
    EXPECT_NEAR(field.at<float>(field.rows - 1, 400), 0.0f, 1e-6);
    // 中间行线性插值
    float mid = field.at<float>(field.rows / 2, 400);
    EXPECT_GT(mid, 0.0f);
    EXPECT_LT(mid, 0.25f);
    // 圆柱外保持 0.5
    EXPECT_FLOAT_EQ(field.at<float>(0, 100), 0.5f);
    EXPECT_FLOAT_EQ(field.at<float>(field.rows - 1, 100), 0.5f);
}

TEST(CurvatureFieldTest, NegativePitchFlipsFarEnd) {
    CylinderGeometry g = scenario_geometry(-30.0, 2.0);
    cv::Mat field = build_curvature_field(g, build_curvature_map(g));

    EXPECT_NEAR(field.at<float>(0, 400), 0.0f, 1e-6);
    EXPECT_NEAR(field.at<float>(field.rows - 1, 400), 0.25f, 1e-6);
}

TEST(CurvatureFieldTest, HorizontalFieldRunsAlongColumns) {
    CylinderParams params = scenario_params();
    params.axis = WarpAxis::Horizontal;
    params.pitch = 30.0;
    params.exaggeration = 2.0;
    CylinderGeometry g = GeometryResolver::resolve(params, cv::Size(600, 400));
    cv::Mat field = build_curvature_field(g, build_curvature_map(g));

    ASSERT_EQ(field.size(), g.canvas_size());
    EXPECT_NEAR(field.at<float>(400, 0), 0.25f, 1e-6);
    EXPECT_NEAR(field.at<float>(400, field.cols - 1), 0.0f, 1e-6);
}

// ============================================
// Parallel generation
// ============================================

TEST(LookupMapsTest, ThreadedBuildMatchesSerial) {
    CylinderGeometry g = scenario_geometry(10.0, 1.5);
    LookupMaps maps = build_lookup_maps(g);

    EXPECT_EQ(maps.angle, build_angle_map(g));
    EXPECT_EQ(maps.curvature, build_curvature_map(g));
}

TEST(LookupMapsTest, FailureOnEitherThreadReachesCaller) {
    CylinderGeometry g = scenario_geometry(0.0, 1.0);
    g.project_dim = -1;

    // 两张表都无法分配，异常应在 join 之后抛给调用方而不是终止进程
    EXPECT_THROW(build_lookup_maps(g), std::length_error);
}
