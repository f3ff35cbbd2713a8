#include <opencv2/opencv.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "undistort_pipeline.hpp"
#include "utils.hpp"

static void usage() {
    std::cout
        << "Usage:\n"
        << "  ./undistort_tool [--config <file>] --calibrate [nx ny] [--debug] [--recompute]\n"
        << "  ./undistort_tool [--config <file>] --image <input> <output>\n"
        << "  ./undistort_tool [--config <file>] --debug-image <input> <output>\n";
}

static int calibrateMode(UndistortPipeline& pipeline, const std::vector<std::string>& args) {
    int nx = 9, ny = 6;
    bool debug = false, recompute = false;
    std::vector<std::string> positional;

    for (const auto& arg : args) {
        if (arg == "--debug") debug = true;
        else if (arg == "--recompute") recompute = true;
        else positional.push_back(arg);
    }
    if (positional.size() == 2) {
        if (!utils::parseInt(positional[0], nx) || !utils::parseInt(positional[1], ny)) {
            std::cerr << "[Main] Board size must be two integers, got "
                      << positional[0] << " " << positional[1] << "\n";
            return 1;
        }
    } else if (!positional.empty()) {
        usage();
        return 1;
    }

    CalibrationResult result = pipeline.calibrate(nx, ny, debug, !recompute);
    if (result.source == CalibrationResult::Source::Cached) {
        std::cout << "[Main] Using stored calibration " << pipeline.config().calFile << "\n";
    } else {
        std::cout << "[Main] Calibrated from " << result.imagesUsed << "/"
                  << result.imagesAttempted << " images, RMS " << result.rmsError << "\n";
    }
    CalibrationParameters calib = pipeline.calibration();
    std::cout << "K:\n" << calib.K << "\n"
              << "dist:\n" << calib.dist << "\n";
    return 0;
}

static int imageMode(UndistortPipeline& pipeline, const std::vector<std::string>& args,
                     bool debug) {
    if (args.size() != 2) {
        usage();
        return 1;
    }

    cv::Mat img = cv::imread(args[0]);
    if (img.empty()) {
        std::cerr << "[Main] Could not read image: " << args[0] << "\n";
        return 1;
    }

    pipeline.calibrate();
    cv::Mat out = debug ? pipeline.debugPipeline(img) : pipeline.pipeline(img);

    if (!cv::imwrite(args[1], out)) {
        std::cerr << "[Main] Could not write image: " << args[1] << "\n";
        return 1;
    }
    std::cout << "[Main] Saved: " << args[1] << "\n";
    return 0;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    PipelineConfig config;
    if (args.size() >= 2 && args[0] == "--config") {
        if (!loadPipelineConfig(args[1], config)) {
            std::cerr << "[Main] Could not load config: " << args[1] << "\n";
            return 1;
        }
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        usage();
        return 1;
    }

    std::string cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());
    UndistortPipeline pipeline(config);

    try {
        if (cmd == "--calibrate")
            return calibrateMode(pipeline, rest);
        if (cmd == "--image")
            return imageMode(pipeline, rest, false);
        if (cmd == "--debug-image")
            return imageMode(pipeline, rest, true);
    } catch (const PipelineError& e) {
        std::cerr << "[Main] " << e.what() << "\n";
        return 1;
    } catch (const cv::Exception& e) {
        std::cerr << "[Main] OpenCV error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << "\n";
        return 1;
    }

    usage();
    return 1;
}
