#include "undistort_pipeline.hpp"

cv::Mat UndistortPipeline::pipeline(const cv::Mat& img) {
    return correctDistortion(img);
}

DebugImageMap UndistortPipeline::pipelineStages(const cv::Mat& img) {
    DebugImageMap imgs;
    imgs["original"] = img;
    imgs["final"] = correctDistortion(img);

    // what the correction moved
    cv::Mat diff;
    cv::absdiff(img, imgs["final"], diff);
    if (diff.channels() == 3)
        cv::cvtColor(diff, diff, cv::COLOR_BGR2GRAY);
    imgs["difference"] = diff;

    return imgs;
}
