#pragma once
#include <opencv2/opencv.hpp>
#include "calibration.hpp"
#include "config.hpp"
#include "debug_compositor.hpp"
#include <string>
#include <vector>

/**
 * Base for per-frame vision pipelines.
 *
 * Call calibrate() once, then pass frames through correctDistortion() before
 * the subclass transform. Each instance owns its calibration.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = PipelineConfig());
    virtual ~Pipeline() = default;

    // Calibrates against every config.calPattern image in config.calDir.
    CalibrationResult calibrate(int nx = 9, int ny = 6,
                                bool debugMode = false,
                                bool preferCached = true);

    CalibrationResult calibrateCamera(const std::vector<std::string>& images,
                                      int nx, int ny,
                                      bool debugMode, bool preferCached);

    cv::Mat correctDistortion(const cv::Mat& img) const;

    // Processed frame, same size as img.
    virtual cv::Mat pipeline(const cv::Mat& img) = 0;

    // Debug variant of pipeline(): must contain "final" plus any intermediates.
    virtual DebugImageMap pipelineStages(const cv::Mat& img);

    cv::Mat debugPipeline(const cv::Mat& img);

    bool isCalibrated() const { return calib_.valid(); }
    // deep copy; the active parameters never change after calibration
    CalibrationParameters calibration() const;
    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    CalibrationParameters calib_;
};
