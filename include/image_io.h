#ifndef IMAGE_IO_H
#define IMAGE_IO_H

#include <opencv2/opencv.hpp>
#include <string>

// 统一转换为 8 位 BGRA；空图抛出 UnreadableSource
cv::Mat to_bgra(const cv::Mat& img, const std::string& what);

// 读取并转换为 8 位 BGRA，文件缺失、无法解码或尺寸为零时抛出 UnreadableSource
cv::Mat load_raster(const std::string& path);

// 写出失败时抛出 std::runtime_error
void save_raster(const std::string& path, const cv::Mat& img);

#endif // IMAGE_IO_H
