#include <opencv2/opencv.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include "batch_runner.h"
#include "cylinder_errors.h"
#include "cylinderize.h"
#include "image_io.h"
#include "lookupData.h"

using namespace cv;
using namespace std;
using namespace std::chrono;

static const char* keys =
    "{help h usage ? |            | print this message }"
    "{@input         |            | input image }"
    "{@arg2          |            | background image, or the output when only two paths are given }"
    "{@arg3          |            | output image }"
    "{m mode         | vertical   | vertical or horizontal cylinder axis }"
    "{r radius       |            | cylinder radius in pixels (default: length dimension / 4) }"
    "{l length       |            | cylinder length in pixels (default: axis dimension, pitch adjusted) }"
    "{w wrap         | 50         | percent of the circumference covered by the image, 10..100 }"
    "{f fcolor       | none       | fill colour for the uncovered part of the cylinder }"
    "{a angle        | 0          | rotation about the cylinder axis in degrees, -360..360 }"
    "{p pitch        | 0          | tilt of the cylinder axis in degrees, -90 < pitch < 90 }"
    "{n narrow       | 100        | taper percent of the far end, 100 means no taper }"
    "{e efactor      | 1          | curvature exaggeration factor, >= 1 }"
    "{s scale        | 100        | resize percent of the wrap dimension, >= 100 }"
    "{o offset       | +0+0       | composite offset on the background, +X+Y }"
    "{v vp           | background | boundary fill: black, white, gray, transparent, background }"
    "{b bgcolor      | none       | colour used when vp=background }"
    "{t trim         |            | trim the result to its content }"
    "{save-maps      |            | write the generated lookups to an .npz file }"
    "{load-maps      |            | use precomputed lookups from an .npz file }"
    "{batch          |            | job list, one 'input [background] output' per line }"
    "{jobs           | 0          | concurrent batch jobs (0: hardware concurrency) }"
    "{verbose        |            | debug logging }"
    "{quiet          |            | errors only }";

// 把命令行参数转换为 CylinderParams，格式错误抛出 InvalidParameter
static CylinderParams parse_params(CommandLineParser& parser) {
    CylinderParams params;
    params.axis = parse_axis(parser.get<String>("m"));

    if (parser.has("r")) {
        params.has_radius = true;
        params.radius = parse_number(parser.get<String>("r"), "radius");
    }
    if (parser.has("l")) {
        params.has_length = true;
        params.length = parse_number(parser.get<String>("l"), "length");
    }
    params.wrap = parse_number(parser.get<String>("w"), "wrap");
    params.angle = parse_number(parser.get<String>("a"), "angle");
    params.pitch = parse_number(parser.get<String>("p"), "pitch");
    params.narrow = parse_number(parser.get<String>("n"), "narrow");
    params.exaggeration = parse_number(parser.get<String>("e"), "efactor");
    params.scale = parse_number(parser.get<String>("s"), "scale");
    params.offset = parse_offset(parser.get<String>("o"));
    params.fill = parse_color(parser.get<String>("f"), "fcolor");
    params.boundary = parse_boundary_policy(parser.get<String>("v"));
    params.background = parse_color(parser.get<String>("b"), "bgcolor");
    params.trim = parser.has("t");

    validate_params(params);
    return params;
}

static int run_batch(const CylinderParams& params, const string& list_path, int jobs) {
    ifstream list(list_path);
    if (!list) {
        cerr << "Error: cannot open job list '" << list_path << "'" << endl;
        return 1;
    }
    vector<BatchJob> batch = ParseJobList(list);
    if (jobs <= 0)
        jobs = static_cast<int>(std::max(1u, thread::hardware_concurrency()));

    auto start = high_resolution_clock::now();
    vector<BatchResult> results = BatchRunner(params, jobs).run(batch);
    auto end = high_resolution_clock::now();

    int failures = 0;
    for (const auto& r : results) {
        if (!r.ok) {
            cerr << r.job.input << ": " << r.error << endl;
            ++failures;
        }
    }
    CV_LOG_INFO(NULL, "批处理完成: " << results.size() - failures << "/" << results.size() << " 成功, 总耗时: "
                << duration_cast<milliseconds>(end - start).count() << "ms");
    return failures == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    CommandLineParser parser(argc, argv, keys);
    parser.about("cylinderize: wrap an image around a cylinder and composite it onto a background");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    if (parser.has("verbose"))
        utils::logging::setLogLevel(utils::logging::LOG_LEVEL_DEBUG);
    else if (parser.has("quiet"))
        utils::logging::setLogLevel(utils::logging::LOG_LEVEL_ERROR);
    else
        utils::logging::setLogLevel(utils::logging::LOG_LEVEL_INFO);

    try {
        CylinderParams params = parse_params(parser);
        int jobs = parser.get<int>("jobs");
        if (!parser.check()) {
            parser.printErrors();
            return 1;
        }

        if (parser.has("batch"))
            return run_batch(params, parser.get<String>("batch"), jobs);

        // 两个路径时第二个是输出，三个路径时中间是背景
        string input = parser.get<String>("@input");
        string arg2 = parser.get<String>("@arg2");
        string arg3 = parser.get<String>("@arg3");
        string background_path, output;
        if (arg3.empty()) {
            output = arg2;
        } else {
            background_path = arg2;
            output = arg3;
        }
        if (input.empty() || output.empty()) {
            parser.printMessage();
            return 1;
        }

        auto start = high_resolution_clock::now();
        Mat source = load_raster(input);
        Mat background;
        if (!background_path.empty())
            background = load_raster(background_path);

        CylinderGeometry geometry = GeometryResolver::resolve(params, source.size());
        LookupMaps maps;
        if (parser.has("load-maps")) {
            LookupData data = ReadLookupData(parser.get<String>("load-maps"));
            if (parser.has("verbose"))
                PrintLookupData(data);
            CheckLookupData(data, geometry);
            maps = data.maps;
        } else {
            maps = build_lookup_maps(geometry);
        }

        Mat result = cylinderize(source, params, geometry, maps, background);
        save_raster(output, result);
        // 查找表只在整条流水线成功后写出
        if (parser.has("save-maps"))
            SaveLookupData(parser.get<String>("save-maps"), geometry, maps);

        auto end = high_resolution_clock::now();
        CV_LOG_INFO(NULL, "总体耗时: " << duration_cast<milliseconds>(end - start).count() << "ms");
    } catch (const CylinderizeError& e) {
        cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
