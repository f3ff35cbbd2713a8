#pragma once
#include <opencv2/opencv.hpp>
#include "config.hpp"
#include <string>
#include <vector>

struct CalibrationParameters {
    cv::Mat K;     // 3x3 camera matrix
    cv::Mat dist;  // distortion coefficients

    bool valid() const { return !K.empty() && !dist.empty(); }
};

struct CalibrationResult {
    enum class Source { Cached, Computed };

    CalibrationParameters params;
    Source source = Source::Computed;

    int imagesAttempted = 0;
    int imagesUsed = 0;
    std::vector<int> skippedImages;   // input indices without a detected board
    cv::Size imageSize;               // size handed to the solver
    double rmsError = 0.0;
};

// (0,0,0) .. (nx-1,ny-1,0), x first. Throws InvalidInputError below 2x2.
std::vector<cv::Point3f> chessboardObjectPoints(int nx, int ny);

/**
 * Calibrates from chessboard photos with nx by ny inner corners.
 *
 * With preferCached the stored parameters at config.calFile are used when they
 * load cleanly; otherwise corners are detected in every image, images without
 * a board are skipped, and the solved parameters are written back to
 * config.calFile. In debugMode corners_foundN.jpg and undistortN.jpg are
 * written to config.resultsDir.
 *
 * Throws InvalidInputError if images is empty or no board is found at all.
 */
CalibrationResult calibrateCameraFromChessboards(
    const std::vector<std::string>& images,
    int nx,
    int ny,
    bool debugMode,
    bool preferCached,
    const PipelineConfig& config
);

cv::Mat undistortImage(const cv::Mat& img, const CalibrationParameters& calib);
