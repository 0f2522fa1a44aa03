#ifndef CYLINDER_PARAMS_H
#define CYLINDER_PARAMS_H

#include <opencv2/opencv.hpp>
#include <string>

// 圆柱轴方向：vertical 模式下水平方向绕圆柱弯曲，horizontal 模式下垂直方向弯曲
enum class WarpAxis {
    Vertical,
    Horizontal
};

// 采样点落在图像外时的填充规则
enum class BoundaryPolicy {
    Black,
    White,
    Gray,
    Transparent,
    Background
};

// 颜色统一按 BGRA 存储，none 即全透明
struct FillColor {
    cv::Scalar bgra = cv::Scalar(0, 0, 0, 0);
    bool none = true;
};

struct CylinderParams {
    WarpAxis axis = WarpAxis::Vertical;

    // radius / length 未显式给出时由源图尺寸推导
    bool has_radius = false;
    double radius = 0.0;
    bool has_length = false;
    double length = 0.0;

    double wrap = 50.0;          // 10..100
    double angle = 0.0;          // -360..360
    double pitch = 0.0;          // (-90, 90)
    double exaggeration = 1.0;   // >= 1
    double narrow = 100.0;       // >= 0, 100 表示不收窄
    double scale = 100.0;        // >= 100, 作用于弯曲方向的尺寸

    cv::Point offset = cv::Point(0, 0);

    FillColor fill;
    BoundaryPolicy boundary = BoundaryPolicy::Background;
    FillColor background;

    bool trim = false;
};

// 检查所有数值参数，越界时抛出 InvalidParameter 并指明字段
void validate_params(const CylinderParams& params);

// 越界采样使用的 BGRA 颜色
cv::Scalar boundary_color(const CylinderParams& params);

WarpAxis parse_axis(const std::string& text);
BoundaryPolicy parse_boundary_policy(const std::string& text);
FillColor parse_color(const std::string& text, const std::string& field);
cv::Point parse_offset(const std::string& text);
double parse_number(const std::string& text, const std::string& field);

const char* axis_name(WarpAxis axis);
const char* boundary_policy_name(BoundaryPolicy policy);

#endif // CYLINDER_PARAMS_H
