#include "frame_compositor.h"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>

cv::Mat FrameCompositor::trim_to_content(const cv::Mat& img, const FillColor& fill) {
    CV_Assert(!img.empty() && img.type() == CV_8UC4);

    // 内容像素：不透明，且不等于填充色
    cv::Mat alpha;
    cv::extractChannel(img, alpha, 3);
    cv::Mat content = alpha > 0;
    if (!fill.none) {
        cv::Mat is_fill;
        cv::inRange(img, fill.bgra, fill.bgra, is_fill);
        cv::bitwise_not(is_fill, is_fill);
        cv::bitwise_and(content, is_fill, content);
    }

    if (cv::countNonZero(content) == 0) {
        CV_LOG_WARNING(NULL, "trim: image has no content pixels, leaving it untrimmed");
        return img;
    }

    std::vector<cv::Point> points;
    cv::findNonZero(content, points);
    cv::Rect box = cv::boundingRect(points);
    return img(box).clone();
}

cv::Mat FrameCompositor::crop_to_frame(const cv::Mat& img, const CylinderGeometry& geometry) {
    CV_Assert(!img.empty());

    const cv::Size frame = geometry.frame_size();
    const int w = std::min(frame.width, img.cols);
    const int h = std::min(frame.height, img.rows);
    cv::Rect box((img.cols - w) / 2, (img.rows - h) / 2, w, h);
    return img(box).clone();
}

cv::Mat FrameCompositor::composite_over(const cv::Mat& foreground, const cv::Mat& background, const cv::Point& offset) {
    CV_Assert(foreground.type() == CV_8UC4 && background.type() == CV_8UC4);

    cv::Mat result = background.clone();

    // 前景在背景坐标系中的位置：居中后再平移
    const cv::Point origin((background.cols - foreground.cols) / 2 + offset.x,
                           (background.rows - foreground.rows) / 2 + offset.y);
    const cv::Rect placed(origin, foreground.size());
    const cv::Rect visible = placed & cv::Rect(0, 0, background.cols, background.rows);
    if (visible.area() == 0) {
        CV_LOG_WARNING(NULL, "composite: foreground at " << origin << " lies outside the background");
        return result;
    }

    cv::parallel_for_(cv::Range(visible.y, visible.y + visible.height), [&](const cv::Range& range) {
        for (int y = range.start; y < range.end; ++y) {
            const cv::Vec4b* fg_row = foreground.ptr<cv::Vec4b>(y - origin.y);
            cv::Vec4b* out_row = result.ptr<cv::Vec4b>(y);

            for (int x = visible.x; x < visible.x + visible.width; ++x) {
                const cv::Vec4b& fg = fg_row[x - origin.x];
                cv::Vec4b& bg = out_row[x];

                const float fa = fg[3] / 255.0f;
                const float ba = bg[3] / 255.0f;
                const float out_a = fa + ba * (1.0f - fa);
                if (out_a <= 0.0f) {
                    bg = cv::Vec4b(0, 0, 0, 0);
                    continue;
                }
                for (int ch = 0; ch < 3; ++ch) {
                    const float blended = (fg[ch] * fa + bg[ch] * ba * (1.0f - fa)) / out_a;
                    bg[ch] = cv::saturate_cast<uchar>(blended);
                }
                bg[3] = cv::saturate_cast<uchar>(out_a * 255.0f);
            }
        }
    });
    return result;
}
