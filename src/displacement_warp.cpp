#include "displacement_warp.h"
#include <opencv2/core/utils/logger.hpp>
#include <cmath>

cv::Mat roll_along_axis(const cv::Mat& img, WarpAxis axis, int shift) {
    const int n = wrap_extent(axis, img.size());
    if (n == 0)
        return img.clone();
    shift %= n;
    if (shift < 0)
        shift += n;
    if (shift == 0)
        return img.clone();

    cv::Mat rolled(img.size(), img.type());
    if (axis == WarpAxis::Vertical) {
        img.colRange(0, n - shift).copyTo(rolled.colRange(shift, n));
        img.colRange(n - shift, n).copyTo(rolled.colRange(0, shift));
    } else {
        img.rowRange(0, n - shift).copyTo(rolled.rowRange(shift, n));
        img.rowRange(n - shift, n).copyTo(rolled.rowRange(0, shift));
    }
    return rolled;
}

cv::Mat prepare_source(const cv::Mat& source, const CylinderParams& params, const CylinderGeometry& geometry) {
    CV_Assert(!source.empty() && source.type() == CV_8UC4);

    const cv::Size target = axis_size(geometry.axis, geometry.wrap_source_dim, geometry.length_px);
    cv::Mat resized;
    if (target == source.size()) {
        resized = source;
    } else {
        const bool shrinking = target.width <= source.cols && target.height <= source.rows;
        cv::resize(source, resized, target, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
    }

    // 弯曲方向居中；沿圆柱轴贴近起始端，负俯仰角时贴近末端
    const int wrap_pos = (geometry.project_dim - geometry.wrap_source_dim) / 2;
    const int length_pos = geometry.exaggerated_offset >= 0.0 ? 0 : geometry.extended_length - geometry.length_px;

    cv::Mat canvas(geometry.canvas_size(), CV_8UC4, params.fill.bgra);
    cv::Rect roi = geometry.axis == WarpAxis::Vertical
        ? cv::Rect(wrap_pos, length_pos, resized.cols, resized.rows)
        : cv::Rect(length_pos, wrap_pos, resized.cols, resized.rows);
    resized.copyTo(canvas(roi));

    return roll_along_axis(canvas, geometry.axis, geometry.roll_pixels);
}

void apply_displacement_warp(
    const cv::Mat& prepared,
    cv::Mat& output,
    const CylinderGeometry& geometry,
    const std::vector<float>& angle_map,
    const cv::Mat& curvature_field,
    const cv::Scalar& border) {

    const cv::Size canvas = geometry.canvas_size();
    CV_Assert(prepared.size() == canvas);
    CV_Assert(curvature_field.size() == canvas && curvature_field.type() == CV_32FC1);
    CV_Assert(static_cast<int>(angle_map.size()) == geometry.project_dim);

    const bool vertical = geometry.axis == WarpAxis::Vertical;
    // 弯曲方向位移幅度为 center，圆柱轴方向为夸张后的倾斜偏移
    const float wrap_scale = static_cast<float>(2.0 * geometry.center);
    const float length_scale = static_cast<float>(2.0 * geometry.exaggerated_offset);

    // 圆柱轮廓外 (|xd| > 1) 的位置一律取边界色
    std::vector<uchar> outside(geometry.project_dim);
    for (int i = 0; i < geometry.project_dim; ++i) {
        const double xd = (i - geometry.center) / geometry.radius;
        outside[i] = (xd > 1.0 || xd < -1.0) ? 1 : 0;
    }
    const float off_canvas = -16.0f;

    cv::Mat map_x(canvas, CV_32FC1);
    cv::Mat map_y(canvas, CV_32FC1);

    cv::parallel_for_(cv::Range(0, canvas.height), [&](const cv::Range& range) {
        for (int y = range.start; y < range.end; ++y) {
            const float* curv_row = curvature_field.ptr<float>(y);
            float* mx = map_x.ptr<float>(y);
            float* my = map_y.ptr<float>(y);
            for (int x = 0; x < canvas.width; ++x) {
                const int w = vertical ? x : y;
                if (outside[w]) {
                    mx[x] = off_canvas;
                    my[x] = off_canvas;
                    continue;
                }
                const float wrap_shift = (angle_map[w] - 0.5f) * wrap_scale;
                const float length_shift = (curv_row[x] - 0.5f) * length_scale;
                if (vertical) {
                    mx[x] = x + wrap_shift;
                    my[x] = y + length_shift;
                } else {
                    mx[x] = x + length_shift;
                    my[x] = y + wrap_shift;
                }
            }
        }
    });

    cv::remap(prepared, output, map_x, map_y, cv::INTER_LINEAR, cv::BORDER_CONSTANT, border);
}
