#ifndef PERSPECTIVE_TAPER_H
#define PERSPECTIVE_TAPER_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "cylinder_params.h"

// 远端两个角向内收缩的像素数: (弯曲方向尺寸 / 2) * (1 - narrow / 100)
double taper_offset(const cv::Size& size, WarpAxis axis, double narrow);

// 梯形四角，顺序为 左上、右上、右下、左下。
// vertical 模式收缩底边，horizontal 模式收缩右边
std::vector<cv::Point2f> taper_corners(const cv::Size& size, WarpAxis axis, double narrow);

// narrow == 100 时原样返回；否则把矩形透视变换到梯形，越界处取 border 颜色
cv::Mat apply_perspective_taper(const cv::Mat& img, WarpAxis axis, double narrow, const cv::Scalar& border);

#endif // PERSPECTIVE_TAPER_H
