#include "perspective_taper.h"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>

double taper_offset(const cv::Size& size, WarpAxis axis, double narrow) {
    const double half = (axis == WarpAxis::Vertical ? size.width : size.height) / 2.0;
    double offset = half * (1.0 - narrow / 100.0);
    // narrow = 0 时远端收成一点，留四分之一像素避免单应矩阵奇异
    return std::min(offset, half - 0.25);
}

std::vector<cv::Point2f> taper_corners(const cv::Size& size, WarpAxis axis, double narrow) {
    const float w = static_cast<float>(size.width);
    const float h = static_cast<float>(size.height);
    const float off = static_cast<float>(taper_offset(size, axis, narrow));

    std::vector<cv::Point2f> corners;
    if (axis == WarpAxis::Vertical) {
        corners.push_back(cv::Point2f(0, 0));
        corners.push_back(cv::Point2f(w, 0));
        corners.push_back(cv::Point2f(w - off, h));
        corners.push_back(cv::Point2f(off, h));
    } else {
        corners.push_back(cv::Point2f(0, 0));
        corners.push_back(cv::Point2f(w, off));
        corners.push_back(cv::Point2f(w, h - off));
        corners.push_back(cv::Point2f(0, h));
    }
    return corners;
}

cv::Mat apply_perspective_taper(const cv::Mat& img, WarpAxis axis, double narrow, const cv::Scalar& border) {
    if (narrow == 100.0)
        return img;

    CV_Assert(!img.empty());
    const float w = static_cast<float>(img.cols);
    const float h = static_cast<float>(img.rows);
    std::vector<cv::Point2f> rect = {
        cv::Point2f(0, 0), cv::Point2f(w, 0), cv::Point2f(w, h), cv::Point2f(0, h)
    };
    std::vector<cv::Point2f> quad = taper_corners(img.size(), axis, narrow);

    cv::Mat H = cv::getPerspectiveTransform(rect, quad);
    CV_LOG_DEBUG(NULL, "taper narrow=" << narrow << " offset=" << taper_offset(img.size(), axis, narrow)
                 << " H=" << H);

    cv::Mat tapered;
    cv::warpPerspective(img, tapered, H, img.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT, border);
    return tapered;
}
