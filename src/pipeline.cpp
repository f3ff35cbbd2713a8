#include "pipeline.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <utility>

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config))
{
}

CalibrationResult Pipeline::calibrate(int nx, int ny, bool debugMode, bool preferCached) {
    auto images = utils::glob(config_.calDir, config_.calPattern);
    return calibrateCamera(images, nx, ny, debugMode, preferCached);
}

CalibrationResult Pipeline::calibrateCamera(const std::vector<std::string>& images,
                                            int nx, int ny,
                                            bool debugMode, bool preferCached) {
    CalibrationResult result = calibrateCameraFromChessboards(
        images, nx, ny, debugMode, preferCached, config_);

    // own copy, never shared with another instance
    calib_.K = result.params.K.clone();
    calib_.dist = result.params.dist.clone();
    return result;
}

CalibrationParameters Pipeline::calibration() const {
    CalibrationParameters copy;
    copy.K = calib_.K.clone();
    copy.dist = calib_.dist.clone();
    return copy;
}

cv::Mat Pipeline::correctDistortion(const cv::Mat& img) const {
    if (!calib_.valid())
        throw NotCalibratedError("correctDistortion called before calibrate");
    if (img.empty())
        throw InvalidInputError("correctDistortion called with an empty image");

    cv::Mat undist = undistortImage(img, calib_);
    CV_Assert(undist.size() == img.size() && undist.type() == img.type());
    return undist;
}

DebugImageMap Pipeline::pipelineStages(const cv::Mat& img) {
    DebugImageMap imgs;
    imgs["final"] = pipeline(img);
    return imgs;
}

cv::Mat Pipeline::debugPipeline(const cv::Mat& img) {
    std::cout << "[Pipeline] Entering debug pipeline\n";
    DebugImageMap imgs = pipelineStages(img);
    return composeDebugImage(imgs);
}
