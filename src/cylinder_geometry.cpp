#include "cylinder_geometry.h"
#include "cylinder_errors.h"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

cv::Size CylinderGeometry::canvas_size() const {
    return axis_size(axis, project_dim, extended_length);
}

cv::Size CylinderGeometry::frame_size() const {
    return axis_size(axis, std::min(crop_dim, project_dim), extended_length);
}

namespace {

void require_finite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw GeometryDegenerate(std::string(what) + " is not finite");
    }
}

// cvRound 对超出 int 范围的值没有定义，先检查再取整
int round_dim(double value, const char* what) {
    require_finite(value, what);
    if (std::fabs(value) > std::numeric_limits<int>::max()) {
        throw GeometryDegenerate(std::string(what) + " " + std::to_string(value) + " exceeds the pixel range");
    }
    return cvRound(value);
}

} // namespace

CylinderGeometry GeometryResolver::resolve(const CylinderParams& params, const cv::Size& source_size) {
    validate_params(params);

    if (source_size.width <= 0 || source_size.height <= 0) {
        throw GeometryDegenerate("source size " + std::to_string(source_size.width) + "x" +
                                 std::to_string(source_size.height) + " leaves nothing to wrap");
    }

    CylinderGeometry g;
    g.axis = params.axis;
    g.source_size = source_size;

    const int src_wrap = wrap_extent(params.axis, source_size);
    const int src_length = length_extent(params.axis, source_size);

    // 弯曲方向先按 scale 放大，再按 wrap 百分比扩展到整个圆周
    g.crop_dim = src_wrap;
    g.wrap_source_dim = round_dim(src_wrap * params.scale / 100.0, "scaled source dimension");
    g.project_dim = round_dim(g.wrap_source_dim * 100.0 / params.wrap, "project dimension");
    g.center = g.project_dim / 2.0;

    // 默认半径取与弯曲方向正交的源图尺寸的四分之一
    g.radius = params.has_radius ? params.radius : src_length / 4.0;

    // 未显式给出 length 时按俯仰角缩短；显式给出时只影响两端的弧度
    const double pitch = params.pitch * CV_PI / 180.0;
    if (params.has_length) {
        g.length = params.length;
    } else {
        g.length = src_length;
        if (params.pitch != 0.0)
            g.length *= std::cos(pitch);
    }

    g.tilt_offset = g.radius * std::sin(pitch);
    g.exaggerated_offset = params.exaggeration * g.tilt_offset;
    g.inverse_exaggeration = 100.0 / params.exaggeration;

    require_finite(g.radius, "radius");
    require_finite(g.length, "length");
    require_finite(g.center, "center");
    require_finite(g.exaggerated_offset, "tilt offset");

    g.length_px = round_dim(g.length, "length");
    g.extended_length = round_dim(g.length + std::fabs(g.exaggerated_offset), "extended length");

    if (g.radius <= 0.0)
        throw GeometryDegenerate("radius resolves to " + std::to_string(g.radius));
    if (g.project_dim < 1 || g.center <= 0.0)
        throw GeometryDegenerate("project dimension resolves to " + std::to_string(g.project_dim));
    if (g.length_px < 1 || g.extended_length < 1)
        throw GeometryDegenerate("cylinder length resolves to " + std::to_string(g.length));

    const int roll = cvRound(std::fabs(params.angle) * g.project_dim / 360.0);
    g.roll_pixels = params.angle < 0 ? -roll : roll;

    CV_LOG_DEBUG(NULL, "cylinder geometry: mode=" << axis_name(g.axis)
                 << " project=" << g.project_dim << " center=" << g.center
                 << " radius=" << g.radius << " length=" << g.length
                 << " tilt=" << g.tilt_offset << " exaggerated=" << g.exaggerated_offset
                 << " extended=" << g.extended_length << " roll=" << g.roll_pixels);
    return g;
}
