#include "lookupData.h"
#include "cylinder_errors.h"
#include <opencv2/core/utils/logger.hpp>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

cnpy::NpyArray& FindArray(cnpy::npz_t& data, const std::string& name) {
    auto it = data.find(name);
    if (it == data.end()) {
        throw std::runtime_error("lookup file has no '" + name + "' array");
    }
    return it->second;
}

template <typename T>
T LoadScalar(cnpy::npz_t& data, const std::string& name) {
    cnpy::NpyArray& arr = FindArray(data, name);
    if (arr.word_size != sizeof(T) || arr.num_vals != 1) {
        throw std::runtime_error(name + " must be a single " + std::to_string(sizeof(T)) + "-byte value");
    }
    return arr.data<T>()[0];
}

} // namespace

std::vector<float> LoadMap(cnpy::npz_t& data, const std::string& name, std::vector<size_t>& shape) {
    cnpy::NpyArray& arr = FindArray(data, name);

    // 验证数组维度
    if (arr.shape.size() != 1) {
        throw std::runtime_error(name + " must be 1-dimensional");
    }
    if (arr.fortran_order) {
        throw std::runtime_error(name + " must be stored in C order");
    }
    // cnpy 不暴露 dtype 字符，只能通过 word_size 验证数据类型；同为 4 字节的 int32 无法区分
    if (arr.word_size != sizeof(float)) {
        std::cerr << "数据类型错误: 期望4字节，实际" << arr.word_size << "字节" << std::endl;
        throw std::runtime_error(name + " must be float32");
    }

    std::vector<float> map(arr.shape[0]);
    std::memcpy(map.data(), arr.data<float>(), map.size() * sizeof(float));
    shape = arr.shape;
    return map;
}

LookupData ReadLookupData(const std::string& filename) {
    LookupData result;

    try {
        cnpy::npz_t data = cnpy::npz_load(filename);

        result.project_dim = LoadScalar<int>(data, "project_dim");
        result.radius = LoadScalar<double>(data, "radius");
        result.center = LoadScalar<double>(data, "center");

        result.maps.angle = LoadMap(data, "angle", result.angle_shape);
        result.maps.curvature = LoadMap(data, "curvature", result.curvature_shape);

        if (result.angle_shape != result.curvature_shape) {
            throw std::runtime_error("angle and curvature must have same dimensions");
        }
        if (static_cast<int>(result.angle_shape[0]) != result.project_dim) {
            throw std::runtime_error("map length " + std::to_string(result.angle_shape[0]) +
                                     " does not match project_dim " + std::to_string(result.project_dim));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading lookup data: " << e.what() << std::endl;
        throw;
    }

    return result;
}

void CheckLookupData(const LookupData& data, const CylinderGeometry& geometry) {
    if (data.project_dim != geometry.project_dim) {
        throw InvalidParameter("maps", "lookup data was built for project_dim " + std::to_string(data.project_dim) +
                                       ", current geometry needs " + std::to_string(geometry.project_dim));
    }
    if (std::fabs(data.radius - geometry.radius) > 1e-9 || std::fabs(data.center - geometry.center) > 1e-9) {
        throw InvalidParameter("maps", "lookup data was built for radius " + std::to_string(data.radius) +
                                       " center " + std::to_string(data.center) + ", current geometry has radius " +
                                       std::to_string(geometry.radius) + " center " + std::to_string(geometry.center));
    }
}

void SaveLookupData(const std::string& filename, const CylinderGeometry& geometry, const LookupMaps& maps) {
    const std::vector<size_t> shape = {maps.angle.size()};
    const std::vector<size_t> scalar = {1};
    const int project_dim = geometry.project_dim;

    cnpy::npz_save(filename, "angle", maps.angle.data(), shape, "w");
    cnpy::npz_save(filename, "curvature", maps.curvature.data(), {maps.curvature.size()}, "a");
    cnpy::npz_save(filename, "project_dim", &project_dim, scalar, "a");
    cnpy::npz_save(filename, "radius", &geometry.radius, scalar, "a");
    cnpy::npz_save(filename, "center", &geometry.center, scalar, "a");

    CV_LOG_INFO(NULL, "lookup data written to " << filename);
}

void PrintLookupData(const LookupData& data) {
    std::cout << std::setprecision(std::numeric_limits<double>::max_digits10);
    std::cout << "project_dim: " << data.project_dim << std::endl;
    std::cout << "radius: " << data.radius << std::endl;
    std::cout << "center: " << data.center << std::endl;

    // 每张表只显示首尾 3 个元素
    auto PrintMap = [](const std::string& name, const std::vector<float>& map) {
        const size_t SHOW = 3;
        std::cout << name << ": [";
        for (size_t i = 0; i < map.size(); ++i) {
            if (map.size() > 2 * SHOW && i >= SHOW && i < map.size() - SHOW) {
                if (i == SHOW) std::cout << "... ";
                continue;
            }
            std::cout << std::setprecision(6) << map[i] << " ";
        }
        std::cout << "\b]" << std::endl;
    };

    PrintMap("angle", data.maps.angle);
    PrintMap("curvature", data.maps.curvature);
}
