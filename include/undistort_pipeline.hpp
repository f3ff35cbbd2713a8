#pragma once
#include "pipeline.hpp"

// Minimal concrete pipeline: the corrected frame is the result.
class UndistortPipeline : public Pipeline {
public:
    using Pipeline::Pipeline;

    cv::Mat pipeline(const cv::Mat& img) override;
    DebugImageMap pipelineStages(const cv::Mat& img) override;
};
