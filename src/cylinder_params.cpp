#include "cylinder_params.h"
#include "cylinder_errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <sstream>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidParameter: return "InvalidParameter";
    case ErrorKind::UnreadableSource: return "UnreadableSource";
    case ErrorKind::GeometryDegenerate: return "GeometryDegenerate";
    }
    return "Unknown";
}

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t first = text.find_first_not_of(" \t");
    size_t last = text.find_last_not_of(" \t");
    if (first == std::string::npos)
        return std::string();
    return text.substr(first, last - first + 1);
}

std::string describe(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

// NaN 也会被判为越界
void require_range(bool ok, const std::string& field, double value, const std::string& range) {
    if (!ok) {
        throw InvalidParameter(field, describe(value) + " is outside " + range);
    }
}

FillColor opaque(double b, double g, double r) {
    FillColor color;
    color.bgra = cv::Scalar(b, g, r, 255);
    color.none = false;
    return color;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

void validate_params(const CylinderParams& params) {
    if (params.has_radius) {
        require_range(params.radius > 0.0 && std::isfinite(params.radius), "radius", params.radius, "(0, inf)");
    }
    if (params.has_length) {
        require_range(params.length > 0.0 && std::isfinite(params.length), "length", params.length, "(0, inf)");
    }
    require_range(params.wrap >= 10.0 && params.wrap <= 100.0, "wrap", params.wrap, "[10, 100]");
    require_range(params.angle >= -360.0 && params.angle <= 360.0, "angle", params.angle, "[-360, 360]");
    require_range(params.pitch > -90.0 && params.pitch < 90.0, "pitch", params.pitch, "(-90, 90)");
    require_range(params.exaggeration >= 1.0 && std::isfinite(params.exaggeration),
                  "efactor", params.exaggeration, "[1, inf)");
    require_range(params.narrow >= 0.0 && std::isfinite(params.narrow), "narrow", params.narrow, "[0, inf)");
    require_range(params.scale >= 100.0 && std::isfinite(params.scale), "scale", params.scale, "[100, inf)");
}

cv::Scalar boundary_color(const CylinderParams& params) {
    switch (params.boundary) {
    case BoundaryPolicy::Black: return cv::Scalar(0, 0, 0, 255);
    case BoundaryPolicy::White: return cv::Scalar(255, 255, 255, 255);
    case BoundaryPolicy::Gray: return cv::Scalar(128, 128, 128, 255);
    case BoundaryPolicy::Transparent: return cv::Scalar(0, 0, 0, 0);
    case BoundaryPolicy::Background: return params.background.bgra;
    }
    return cv::Scalar(0, 0, 0, 0);
}

WarpAxis parse_axis(const std::string& text) {
    std::string value = lowercase(text);
    if (value == "vertical" || value == "v")
        return WarpAxis::Vertical;
    if (value == "horizontal" || value == "h")
        return WarpAxis::Horizontal;
    throw InvalidParameter("mode", "expected vertical or horizontal, got '" + text + "'");
}

BoundaryPolicy parse_boundary_policy(const std::string& text) {
    std::string value = lowercase(text);
    if (value == "black") return BoundaryPolicy::Black;
    if (value == "white") return BoundaryPolicy::White;
    if (value == "gray" || value == "grey") return BoundaryPolicy::Gray;
    if (value == "transparent" || value == "none") return BoundaryPolicy::Transparent;
    if (value == "background") return BoundaryPolicy::Background;
    throw InvalidParameter("vp", "expected black, white, gray, transparent or background, got '" + text + "'");
}

FillColor parse_color(const std::string& text, const std::string& field) {
    std::string value = lowercase(text);

    if (value.empty() || value == "none" || value == "transparent")
        return FillColor();

    if (value == "black") return opaque(0, 0, 0);
    if (value == "white") return opaque(255, 255, 255);
    if (value == "gray" || value == "grey") return opaque(128, 128, 128);
    if (value == "red") return opaque(0, 0, 255);
    if (value == "green") return opaque(0, 128, 0);
    if (value == "blue") return opaque(255, 0, 0);
    if (value == "yellow") return opaque(0, 255, 255);
    if (value == "cyan") return opaque(255, 255, 0);
    if (value == "magenta") return opaque(255, 0, 255);

    if (value[0] == '#') {
        std::string hex = value.substr(1);
        for (char c : hex) {
            if (hex_digit(c) < 0)
                throw InvalidParameter(field, "bad hex colour '" + text + "'");
        }
        int channels[4] = {0, 0, 0, 255};
        if (hex.size() == 3) {
            for (int i = 0; i < 3; ++i)
                channels[i] = hex_digit(hex[i]) * 17;
        } else if (hex.size() == 6 || hex.size() == 8) {
            for (size_t i = 0; i < hex.size() / 2; ++i)
                channels[i] = hex_digit(hex[2 * i]) * 16 + hex_digit(hex[2 * i + 1]);
        } else {
            throw InvalidParameter(field, "bad hex colour '" + text + "'");
        }
        FillColor color;
        color.bgra = cv::Scalar(channels[2], channels[1], channels[0], channels[3]);
        color.none = false;
        return color;
    }

    // rgb(r,g,b) / rgba(r,g,b,a)，a 取 0..1
    double r = 0, g = 0, b = 0, a = 1.0;
    int consumed = 0;
    bool parsed = false;
    if (value.compare(0, 5, "rgba(") == 0) {
        parsed = std::sscanf(value.c_str(), "rgba(%lf,%lf,%lf,%lf)%n", &r, &g, &b, &a, &consumed) == 4;
    } else if (value.compare(0, 4, "rgb(") == 0) {
        parsed = std::sscanf(value.c_str(), "rgb(%lf,%lf,%lf)%n", &r, &g, &b, &consumed) == 3;
    }
    if (!parsed || consumed != static_cast<int>(value.size()))
        throw InvalidParameter(field, "unrecognised colour '" + text + "'");
    if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255 || a < 0 || a > 1)
        throw InvalidParameter(field, "colour component out of range in '" + text + "'");

    FillColor color;
    color.bgra = cv::Scalar(b, g, r, cvRound(a * 255.0));
    color.none = false;
    return color;
}

cv::Point parse_offset(const std::string& text) {
    static const std::regex offset_regex("([+-][0-9]+)([+-][0-9]+)");
    std::smatch parts;
    std::string value = lowercase(text);
    if (!std::regex_match(value, parts, offset_regex))
        throw InvalidParameter("offset", "expected +X+Y, got '" + text + "'");
    return cv::Point(std::atoi(parts[1].str().c_str()), std::atoi(parts[2].str().c_str()));
}

double parse_number(const std::string& text, const std::string& field) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value))
        throw InvalidParameter(field, "not a number: '" + text + "'");
    return value;
}

const char* axis_name(WarpAxis axis) {
    return axis == WarpAxis::Vertical ? "vertical" : "horizontal";
}

const char* boundary_policy_name(BoundaryPolicy policy) {
    switch (policy) {
    case BoundaryPolicy::Black: return "black";
    case BoundaryPolicy::White: return "white";
    case BoundaryPolicy::Gray: return "gray";
    case BoundaryPolicy::Transparent: return "transparent";
    case BoundaryPolicy::Background: return "background";
    }
    return "unknown";
}
