#ifndef LOOKUP_DATA_H
#define LOOKUP_DATA_H

#include <cnpy.h>
#include <string>
#include <vector>
#include "cylinder_geometry.h"
#include "lookup_maps.h"

// 保存在 .npz 中的查找表及其生成时的几何量
struct LookupData {
    int project_dim = 0;
    double radius = 0.0;
    double center = 0.0;
    LookupMaps maps;

    std::vector<size_t> angle_shape;
    std::vector<size_t> curvature_shape;
};

// 读取一维 float32 数组的辅助函数
std::vector<float> LoadMap(cnpy::npz_t& data, const std::string& name, std::vector<size_t>& shape);

// 读取查找表文件，格式不符时抛出 std::runtime_error
LookupData ReadLookupData(const std::string& filename);

// 查找表必须由同一几何生成：project_dim、radius、center 不一致时抛出 InvalidParameter("maps")
void CheckLookupData(const LookupData& data, const CylinderGeometry& geometry);

// 写出 angle / curvature 及 project_dim、radius、center
void SaveLookupData(const std::string& filename, const CylinderGeometry& geometry, const LookupMaps& maps);

// 打印查找表概要
void PrintLookupData(const LookupData& data);

#endif // LOOKUP_DATA_H
