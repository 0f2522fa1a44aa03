#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <opencv2/opencv.hpp>
#include "cylinder_params.h"

// BGRA 颜色
inline cv::Scalar bgra(int b, int g, int r, int a = 255) {
    return cv::Scalar(b, g, r, a);
}

inline cv::Mat solid_image(int width, int height, const cv::Scalar& color) {
    return cv::Mat(height, width, CV_8UC4, color);
}

inline cv::Mat solid_red(int width, int height) {
    return solid_image(width, height, bgra(0, 0, 255));
}

// 400x600 竖直圆柱的典型参数: radius 100, wrap 50
inline CylinderParams scenario_params() {
    CylinderParams params;
    params.axis = WarpAxis::Vertical;
    params.has_radius = true;
    params.radius = 100.0;
    params.wrap = 50.0;
    return params;
}

inline bool is_red(const cv::Vec4b& px) {
    return px[0] < 10 && px[1] < 10 && px[2] > 245 && px[3] > 245;
}

inline bool is_blue(const cv::Vec4b& px) {
    return px[0] > 245 && px[1] < 10 && px[2] < 10 && px[3] > 245;
}

#endif // TEST_HELPERS_H
