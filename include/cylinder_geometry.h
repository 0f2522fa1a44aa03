#ifndef CYLINDER_GEOMETRY_H
#define CYLINDER_GEOMETRY_H

#include <opencv2/opencv.hpp>
#include "cylinder_params.h"

// 由参数和源图尺寸推导出的像素几何量，计算后不再修改
struct CylinderGeometry {
    WarpAxis axis = WarpAxis::Vertical;
    cv::Size source_size;

    int crop_dim = 0;          // 原始源图在弯曲方向上的尺寸，最终裁剪用
    int wrap_source_dim = 0;   // 按 scale 放大后的弯曲方向尺寸
    int project_dim = 0;       // wrap_source_dim * 100 / wrap
    double center = 0.0;       // project_dim / 2

    double radius = 0.0;
    double length = 0.0;
    int length_px = 0;

    double tilt_offset = 0.0;        // radius * sin(pitch)
    double exaggerated_offset = 0.0; // exaggeration * tilt_offset
    double inverse_exaggeration = 100.0; // 100 / exaggeration, 百分比
    int extended_length = 0;         // length + |exaggerated_offset|

    int roll_pixels = 0;

    // 画布在图像坐标系下的尺寸（宽, 高）
    cv::Size canvas_size() const;
    // 最终裁剪框尺寸
    cv::Size frame_size() const;
};

class GeometryResolver {
public:
    // 参数越界时抛出 InvalidParameter，推导结果为零或非有限值时抛出 GeometryDegenerate
    static CylinderGeometry resolve(const CylinderParams& params, const cv::Size& source_size);
};

// 轴向无关的尺寸换算：wrap 为弯曲方向，length 为圆柱轴方向
inline cv::Size axis_size(WarpAxis axis, int wrap_dim, int length_dim) {
    return axis == WarpAxis::Vertical ? cv::Size(wrap_dim, length_dim) : cv::Size(length_dim, wrap_dim);
}

inline int wrap_extent(WarpAxis axis, const cv::Size& size) {
    return axis == WarpAxis::Vertical ? size.width : size.height;
}

inline int length_extent(WarpAxis axis, const cv::Size& size) {
    return axis == WarpAxis::Vertical ? size.height : size.width;
}

#endif // CYLINDER_GEOMETRY_H
