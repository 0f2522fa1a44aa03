#include "cylinderize.h"
#include "cylinder_errors.h"
#include "displacement_warp.h"
#include "frame_compositor.h"
#include "image_io.h"
#include "perspective_taper.h"
#include <opencv2/core/utils/logger.hpp>
#include <chrono>

using namespace std::chrono;

cv::Mat cylinderize(const cv::Mat& source, const CylinderParams& params, const cv::Mat& background) {
    validate_params(params);
    cv::Mat src = to_bgra(source, "source image");

    CylinderGeometry geometry = GeometryResolver::resolve(params, src.size());
    LookupMaps maps = build_lookup_maps(geometry);
    return cylinderize(src, params, geometry, maps, background);
}

cv::Mat cylinderize(const cv::Mat& source, const CylinderParams& params, const CylinderGeometry& geometry,
                    const LookupMaps& maps, const cv::Mat& background) {
    validate_params(params);
    cv::Mat src = to_bgra(source, "source image");
    cv::Mat bg;
    if (!background.empty())
        bg = to_bgra(background, "background image");

    if (geometry.axis != params.axis || geometry.source_size != src.size()) {
        throw InvalidParameter("geometry", "was resolved for a different source or mode");
    }
    if (static_cast<int>(maps.angle.size()) != geometry.project_dim ||
        static_cast<int>(maps.curvature.size()) != geometry.project_dim) {
        throw InvalidParameter("maps", "lookup length " + std::to_string(maps.angle.size()) + "/" +
                               std::to_string(maps.curvature.size()) + " does not match project dimension " +
                               std::to_string(geometry.project_dim));
    }

    const cv::Scalar border = boundary_color(params);

    // 缩放、扩展、绕轴旋转
    auto start_prepare = high_resolution_clock::now();
    cv::Mat prepared = prepare_source(src, params, geometry);
    cv::Mat field = build_curvature_field(geometry, maps.curvature);
    auto end_prepare = high_resolution_clock::now();
    CV_LOG_INFO(NULL, "源图准备耗时: " << duration_cast<milliseconds>(end_prepare - start_prepare).count() << "ms");

    // 柱面位移重采样
    auto start_warp = high_resolution_clock::now();
    cv::Mat warped;
    apply_displacement_warp(prepared, warped, geometry, maps.angle, field, border);
    prepared.release();
    field.release();
    auto end_warp = high_resolution_clock::now();
    CV_LOG_INFO(NULL, "柱面变形耗时: " << duration_cast<milliseconds>(end_warp - start_warp).count() << "ms");

    // 透视收窄，narrow = 100 时不做任何处理
    auto start_taper = high_resolution_clock::now();
    cv::Mat tapered = apply_perspective_taper(warped, params.axis, params.narrow, border);
    warped.release();
    auto end_taper = high_resolution_clock::now();
    if (params.narrow != 100.0) {
        CV_LOG_INFO(NULL, "透视收窄耗时: " << duration_cast<milliseconds>(end_taper - start_taper).count() << "ms");
    }

    cv::Mat framed = params.trim
        ? FrameCompositor::trim_to_content(tapered, params.fill)
        : FrameCompositor::crop_to_frame(tapered, geometry);
    tapered.release();

    if (bg.empty())
        return framed;

    auto start_composite = high_resolution_clock::now();
    cv::Mat result = FrameCompositor::composite_over(framed, bg, params.offset);
    auto end_composite = high_resolution_clock::now();
    CV_LOG_INFO(NULL, "背景合成耗时: " << duration_cast<milliseconds>(end_composite - start_composite).count() << "ms");
    return result;
}
