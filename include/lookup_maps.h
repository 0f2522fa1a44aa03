#ifndef LOOKUP_MAPS_H
#define LOOKUP_MAPS_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "cylinder_geometry.h"

// 沿弯曲方向的两张一维查找表，长度均为 project_dim，生成后只读
struct LookupMaps {
    std::vector<float> angle;
    std::vector<float> curvature;
};

// 反正弦展开表：弯曲方向上每个像素对应源图的采样比例
std::vector<float> build_angle_map(const CylinderGeometry& geometry);

// 圆截面表：每个像素处圆柱近端表面的隆起量，圆柱外为 0.5
std::vector<float> build_curvature_map(const CylinderGeometry& geometry);

// 把曲率表铺满整个画布 (CV_32FC1)，无倾斜时为常数 0.5；exaggeration != 1 时沿圆柱轴在近端原始曲率
// 与远端按 inverse_exaggeration 压缩的曲率之间线性插值
cv::Mat build_curvature_field(const CylinderGeometry& geometry, const std::vector<float>& curvature);

// 两张表互不依赖，分别在两个线程上生成
LookupMaps build_lookup_maps(const CylinderGeometry& geometry);

#endif // LOOKUP_MAPS_H
