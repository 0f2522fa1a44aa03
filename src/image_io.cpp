#include "image_io.h"
#include "cylinder_errors.h"
#include <opencv2/core/utils/logger.hpp>

cv::Mat to_bgra(const cv::Mat& img, const std::string& what) {
    if (img.empty() || img.cols <= 0 || img.rows <= 0) {
        throw UnreadableSource(what + " is empty");
    }

    cv::Mat img8;
    if (img.depth() == CV_8U) {
        img8 = img;
    } else if (img.depth() == CV_16U) {
        img.convertTo(img8, CV_8U, 1.0 / 257.0);
    } else if (img.depth() == CV_32F || img.depth() == CV_64F) {
        img.convertTo(img8, CV_8U, 255.0);
    } else {
        img.convertTo(img8, CV_8U);
    }

    cv::Mat bgra;
    switch (img8.channels()) {
    case 1: cv::cvtColor(img8, bgra, cv::COLOR_GRAY2BGRA); break;
    case 3: cv::cvtColor(img8, bgra, cv::COLOR_BGR2BGRA); break;
    case 4: bgra = img8; break;
    default:
        throw UnreadableSource(what + " has unsupported channel count " + std::to_string(img8.channels()));
    }
    return bgra;
}

cv::Mat load_raster(const std::string& path) {
    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw UnreadableSource("cannot read image '" + path + "'");
    }
    CV_LOG_DEBUG(NULL, "loaded " << path << " " << img.cols << "x" << img.rows << " channels=" << img.channels());
    return to_bgra(img, "image '" + path + "'");
}

void save_raster(const std::string& path, const cv::Mat& img) {
    bool ok = false;
    try {
        ok = cv::imwrite(path, img);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("cannot write image '" + path + "': " + e.what());
    }
    if (!ok) {
        throw std::runtime_error("cannot write image '" + path + "'");
    }
}
