#ifndef CYLINDERIZE_H
#define CYLINDERIZE_H

#include <opencv2/opencv.hpp>
#include "cylinder_geometry.h"
#include "cylinder_params.h"
#include "lookup_maps.h"

// 把平面图像贴到圆柱上；background 为空时直接返回裁剪后的结果。
// 参数错误抛出 InvalidParameter，源图不可用抛出 UnreadableSource，
// 几何退化抛出 GeometryDegenerate
cv::Mat cylinderize(const cv::Mat& source, const CylinderParams& params, const cv::Mat& background = cv::Mat());

// 使用外部提供的查找表（例如从 .npz 读出）；表长必须等于 geometry.project_dim
cv::Mat cylinderize(const cv::Mat& source, const CylinderParams& params, const CylinderGeometry& geometry,
                    const LookupMaps& maps, const cv::Mat& background = cv::Mat());

#endif // CYLINDERIZE_H
