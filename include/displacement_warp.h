#ifndef DISPLACEMENT_WARP_H
#define DISPLACEMENT_WARP_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "cylinder_geometry.h"
#include "cylinder_params.h"

// 沿弯曲方向循环平移 shift 个像素，实现绕轴旋转
cv::Mat roll_along_axis(const cv::Mat& img, WarpAxis axis, int shift);

// 缩放到 (wrap_source_dim x length)，用填充色扩展到整个画布，再按 roll_pixels 循环平移
cv::Mat prepare_source(const cv::Mat& source, const CylinderParams& params, const CylinderGeometry& geometry);

// 把一维角度表和二维曲率场展开成 remap 坐标，对准备好的源图做双线性重采样。
// 越界采样取 border 颜色；输入的表不会被修改
void apply_displacement_warp(
    const cv::Mat& prepared,
    cv::Mat& output,
    const CylinderGeometry& geometry,
    const std::vector<float>& angle_map,
    const cv::Mat& curvature_field,
    const cv::Scalar& border);

#endif // DISPLACEMENT_WARP_H
