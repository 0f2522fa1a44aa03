#include "batch_runner.h"
#include "cylinder_errors.h"
#include "cylinderize.h"
#include "image_io.h"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

using namespace std::chrono;

std::vector<BatchJob> ParseJobList(std::istream& in) {
    std::vector<BatchJob> jobs;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (fields >> part)
            parts.push_back(part);

        if (parts.empty())
            continue;

        BatchJob job;
        if (parts.size() == 2) {
            job.input = parts[0];
            job.output = parts[1];
        } else if (parts.size() == 3) {
            job.input = parts[0];
            job.background = parts[1];
            job.output = parts[2];
        } else {
            throw InvalidParameter("batch", "line " + std::to_string(line_no) +
                                   ": expected 'input [background] output'");
        }
        jobs.push_back(job);
    }
    return jobs;
}

BatchRunner::BatchRunner(const CylinderParams& params, int max_jobs)
    : params_(params), max_jobs_(std::max(1, max_jobs)) {}

BatchResult BatchRunner::run_one(const BatchJob& job) const {
    BatchResult result;
    result.job = job;

    auto start = high_resolution_clock::now();
    try {
        cv::Mat source = load_raster(job.input);
        cv::Mat background;
        if (!job.background.empty())
            background = load_raster(job.background);

        cv::Mat output = cylinderize(source, params_, background);
        save_raster(job.output, output);
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    auto end = high_resolution_clock::now();
    result.elapsed_ms = duration_cast<milliseconds>(end - start).count();

    if (result.ok) {
        CV_LOG_INFO(NULL, job.input << " -> " << job.output << " 耗时: " << result.elapsed_ms << "ms");
    } else {
        CV_LOG_ERROR(NULL, job.input << " failed: " << result.error);
    }
    return result;
}

std::vector<BatchResult> BatchRunner::run(const std::vector<BatchJob>& jobs) const {
    std::vector<BatchResult> results(jobs.size());

    // 工作线程从共享下标取任务，每个任务只写自己的结果槽
    std::mutex queue_mutex;
    size_t next = 0;
    auto worker = [&] {
        for (;;) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (next >= jobs.size())
                    return;
                index = next++;
            }
            results[index] = run_one(jobs[index]);
        }
    };

    const size_t workers = std::min(static_cast<size_t>(max_jobs_), jobs.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back(worker);
    for (auto& th : threads)
        th.join();

    return results;
}
