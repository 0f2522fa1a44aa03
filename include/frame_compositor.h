#ifndef FRAME_COMPOSITOR_H
#define FRAME_COMPOSITOR_H

#include <opencv2/opencv.hpp>
#include "cylinder_geometry.h"
#include "cylinder_params.h"

class FrameCompositor {
public:
    // 裁掉透明像素和填充色像素外围的部分；全空时原样返回
    static cv::Mat trim_to_content(const cv::Mat& img, const FillColor& fill);

    // 居中裁剪到 原始弯曲方向尺寸 x 扩展后的长度，去掉溢出的弧形部分
    static cv::Mat crop_to_frame(const cv::Mat& img, const CylinderGeometry& geometry);

    // 前景居中放到背景上，再平移 offset，按 alpha 叠加；结果与背景同尺寸
    static cv::Mat composite_over(const cv::Mat& foreground, const cv::Mat& background, const cv::Point& offset);
};

#endif // FRAME_COMPOSITOR_H
