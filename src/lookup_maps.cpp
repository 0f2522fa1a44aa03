#include "lookup_maps.h"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <thread>

using namespace std::chrono;

std::vector<float> build_angle_map(const CylinderGeometry& geometry) {
    const int n = geometry.project_dim;
    const double center = geometry.center;
    const double radius = geometry.radius;

    std::vector<float> map(n);
    for (int i = 0; i < n; ++i) {
        const double xd = (i - center) / radius;
        double value;
        if (xd > 1.0 || xd < -1.0) {
            // 圆柱轮廓之外
            value = 1.0;
        } else {
            // 靠近轮廓边缘处 asin 压缩源图，中间近似线性
            value = 0.5 * (std::asin(xd) / CV_PI + (center - i) / center) + 0.5;
        }
        map[i] = static_cast<float>(std::min(1.0, std::max(0.0, value)));
    }
    return map;
}

std::vector<float> build_curvature_map(const CylinderGeometry& geometry) {
    const int n = geometry.project_dim;
    const double center = geometry.center;
    const double radius = geometry.radius;

    std::vector<float> map(n);
    for (int i = 0; i < n; ++i) {
        const double xd = (i - center) / radius;
        double value = 0.5;
        if (xd <= 1.0 && xd >= -1.0) {
            value = 0.5 * (-std::sqrt(1.0 - xd * xd)) + 0.5;
        }
        map[i] = static_cast<float>(value);
    }
    return map;
}

cv::Mat build_curvature_field(const CylinderGeometry& geometry, const std::vector<float>& curvature) {
    CV_Assert(static_cast<int>(curvature.size()) == geometry.project_dim);

    const cv::Size canvas = geometry.canvas_size();
    // 没有倾斜时两端是直线，位移场为常数 0.5
    if (geometry.exaggerated_offset == 0.0)
        return cv::Mat(canvas, CV_32FC1, cv::Scalar(0.5));

    const int length = geometry.extended_length;
    const bool vertical = geometry.axis == WarpAxis::Vertical;
    const bool blend = geometry.inverse_exaggeration != 100.0;
    const float far_scale = static_cast<float>(geometry.inverse_exaggeration / 100.0);
    const bool far_at_start = geometry.exaggerated_offset >= 0.0;

    // 沿圆柱轴的线性斜坡：远端为 0，近端为 1
    std::vector<float> ramp(length, 1.0f);
    if (blend) {
        for (int l = 0; l < length; ++l) {
            float t = length > 1 ? static_cast<float>(l) / (length - 1) : 0.0f;
            ramp[l] = far_at_start ? t : 1.0f - t;
        }
    }

    cv::Mat field(canvas, CV_32FC1);
    cv::parallel_for_(cv::Range(0, canvas.height), [&](const cv::Range& range) {
        for (int y = range.start; y < range.end; ++y) {
            float* row = field.ptr<float>(y);
            for (int x = 0; x < canvas.width; ++x) {
                const int w = vertical ? x : y;
                const int l = vertical ? y : x;
                const float c = curvature[w];
                if (!blend) {
                    row[x] = c;
                    continue;
                }
                const float compressed = 0.5f + (c - 0.5f) * far_scale;
                row[x] = c * ramp[l] + compressed * (1.0f - ramp[l]);
            }
        }
    });
    return field;
}

LookupMaps build_lookup_maps(const CylinderGeometry& geometry) {
    LookupMaps maps;

    auto start_maps = high_resolution_clock::now();
    std::exception_ptr curvature_error;
    std::thread th_curvature([&] {
        try {
            maps.curvature = build_curvature_map(geometry);
        } catch (...) {
            curvature_error = std::current_exception();
        }
    });
    // 无论哪一侧失败都先 join，再把异常交给调用方
    try {
        maps.angle = build_angle_map(geometry);
    } catch (...) {
        th_curvature.join();
        throw;
    }
    th_curvature.join();
    if (curvature_error)
        std::rethrow_exception(curvature_error);
    auto end_maps = high_resolution_clock::now();

    CV_LOG_DEBUG(NULL, "查找表生成耗时: " << duration_cast<milliseconds>(end_maps - start_maps).count()
                 << "ms (" << geometry.project_dim << " entries)");
    return maps;
}
