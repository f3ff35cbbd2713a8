#pragma once
#include <string>

struct PipelineConfig {
    std::string calDir     = "camera_cal";
    std::string resultsDir = "results";
    std::string calFile    = "results/calibration_data.yml";
    std::string calPattern = "calibration*.jpg";
};

// Optional keys: cal_dir, results_dir, cal_file, cal_pattern.
// Missing keys keep their current value.
bool loadPipelineConfig(const std::string& path, PipelineConfig& config);
