#include "config.hpp"
#include "utils.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>

static bool readString(const cv::FileStorage& fs, const char* key, std::string& out) {
    cv::FileNode node = fs[key];
    if (node.empty() || !node.isString()) return false;
    out = (std::string)node;
    return true;
}

bool loadPipelineConfig(const std::string& path, PipelineConfig& config) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            std::cerr << "[Config] Could not open " << path << "\n";
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[Config] Could not parse " << path << ": " << e.what() << "\n";
        return false;
    }

    readString(fs, "cal_dir", config.calDir);
    readString(fs, "cal_pattern", config.calPattern);

    bool hasResults = readString(fs, "results_dir", config.resultsDir);
    if (!readString(fs, "cal_file", config.calFile) && hasResults)
        config.calFile = utils::joinPath(config.resultsDir, "calibration_data.yml");

    return true;
}
