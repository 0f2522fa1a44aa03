#ifndef CYLINDER_ERRORS_H
#define CYLINDER_ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidParameter,
    UnreadableSource,
    GeometryDegenerate
};

// 所有柱面变形错误的基类，每次调用遇到即终止，不做内部重试
class CylinderizeError : public std::runtime_error {
public:
    CylinderizeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// 参数越界或格式错误，在任何图像处理之前报告
class InvalidParameter : public CylinderizeError {
public:
    InvalidParameter(const std::string& field, const std::string& message)
        : CylinderizeError(ErrorKind::InvalidParameter, "invalid parameter '" + field + "': " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// 源图或背景图缺失、尺寸为零或无法解码
class UnreadableSource : public CylinderizeError {
public:
    explicit UnreadableSource(const std::string& message)
        : CylinderizeError(ErrorKind::UnreadableSource, message) {}
};

// 推导出的几何量会除零或不是有限值
class GeometryDegenerate : public CylinderizeError {
public:
    explicit GeometryDegenerate(const std::string& message)
        : CylinderizeError(ErrorKind::GeometryDegenerate, message) {}
};

const char* error_kind_name(ErrorKind kind);

#endif // CYLINDER_ERRORS_H
