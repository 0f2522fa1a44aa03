#ifndef BATCH_RUNNER_H
#define BATCH_RUNNER_H

#include <istream>
#include <string>
#include <vector>
#include "cylinder_params.h"

struct BatchJob {
    std::string input;
    std::string background;   // 为空表示不合成背景
    std::string output;
};

struct BatchResult {
    BatchJob job;
    bool ok = false;
    std::string error;
    long long elapsed_ms = 0;
};

// 每行 "input [background] output"，忽略空行和 # 注释；格式错误抛出 InvalidParameter
std::vector<BatchJob> ParseJobList(std::istream& in);

// 每个任务独立执行 读图 -> cylinderize -> 写图，最多 max_jobs 个并发
class BatchRunner {
public:
    BatchRunner(const CylinderParams& params, int max_jobs);

    std::vector<BatchResult> run(const std::vector<BatchJob>& jobs) const;

    // 单个任务，不抛异常，错误记录在结果里
    BatchResult run_one(const BatchJob& job) const;

private:
    CylinderParams params_;
    int max_jobs_;
};

#endif // BATCH_RUNNER_H
