#include "calibration.hpp"
#include "calibration_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

static void writeUndistortedImages(const std::vector<std::string>& images,
                                   const CalibrationParameters& calib,
                                   const std::string& resultsDir) {
    for (size_t idx = 0; idx < images.size(); idx++) {
        cv::Mat img = cv::imread(images[idx]);
        if (img.empty()) {
            std::cerr << "[Calibration] Could not read image: " << images[idx] << "\n";
            continue;
        }

        std::string name = utils::joinPath(resultsDir, "undistort" + std::to_string(idx) + ".jpg");
        if (!cv::imwrite(name, undistortImage(img, calib)))
            std::cerr << "[Calibration] Could not write " << name << "\n";
    }
}

std::vector<cv::Point3f> chessboardObjectPoints(int nx, int ny) {
    if (nx < 2 || ny < 2)
        throw InvalidInputError("chessboard needs at least 2x2 inner corners, got " +
                                std::to_string(nx) + "x" + std::to_string(ny));

    std::vector<cv::Point3f> objp;
    objp.reserve(nx * ny);
    for (int j = 0; j < ny; j++)
        for (int i = 0; i < nx; i++)
            objp.emplace_back((float)i, (float)j, 0.0f);
    return objp;
}

CalibrationResult calibrateCameraFromChessboards(
    const std::vector<std::string>& images,
    int nx,
    int ny,
    bool debugMode,
    bool preferCached,
    const PipelineConfig& config
) {
    CalibrationResult result;

    if (debugMode && !utils::ensureDirectory(config.resultsDir))
        std::cerr << "[Calibration] Debug images will not be written\n";

    if (preferCached) {
        std::cout << "[Calibration] Reading pre-calculated calibration data\n";
        LoadStatus status = loadCalibration(config.calFile, result.params);
        if (status == LoadStatus::Ok) {
            result.source = CalibrationResult::Source::Cached;
            if (debugMode) writeUndistortedImages(images, result.params, config.resultsDir);
            return result;
        }
        std::cout << "[Calibration] Unable to read calibration data from " << config.calFile
                  << " (" << toString(status) << "), proceeding to calculate\n";
    }

    if (images.empty())
        throw InvalidInputError("no calibration images given");

    const cv::Size boardSize(nx, ny);
    const std::vector<cv::Point3f> objp = chessboardObjectPoints(nx, ny);

    std::vector<std::vector<cv::Point3f>> objectPoints;
    std::vector<std::vector<cv::Point2f>> imagePoints;

    for (size_t idx = 0; idx < images.size(); idx++) {
        const std::string& path = images[idx];
        std::cout << "[Calibration] Calibrating against image " << idx << ": " << path << "\n";
        result.imagesAttempted++;

        cv::Mat img = cv::imread(path);
        if (img.empty()) {
            std::cerr << "[Calibration] Could not read image: " << path << "\n";
            result.skippedImages.push_back((int)idx);
            continue;
        }

        cv::Mat gray;
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
        // solver always gets the first decoded image's size
        if (result.imageSize.empty())
            result.imageSize = gray.size();

        std::vector<cv::Point2f> corners;
        if (!cv::findChessboardCorners(gray, boardSize, corners)) {
            std::cout << "[Calibration] No corners found in image.\n";
            result.skippedImages.push_back((int)idx);
            continue;
        }

        cv::cornerSubPix(
            gray, corners, {11,11}, {-1,-1},
            cv::TermCriteria(cv::TermCriteria::EPS +
                             cv::TermCriteria::MAX_ITER, 30, 1e-3)
        );

        objectPoints.push_back(objp);
        imagePoints.push_back(corners);
        result.imagesUsed++;

        if (debugMode) {
            cv::drawChessboardCorners(img, boardSize, corners, true);
            std::string name = utils::joinPath(config.resultsDir,
                                               "corners_found" + std::to_string(idx) + ".jpg");
            if (!cv::imwrite(name, img))
                std::cerr << "[Calibration] Could not write " << name << "\n";
        }
    }

    if (objectPoints.empty())
        throw InvalidInputError("no chessboard corners found in any of " +
                                std::to_string(images.size()) + " calibration images");

    std::cout << "[Calibration] Finished calibration images ... Running calibration algorithm on "
              << result.imagesUsed << " of " << images.size() << " images\n";

    result.params.K = cv::Mat::eye(3,3,CV_64F);
    result.params.dist = cv::Mat::zeros(1,5,CV_64F);

    result.rmsError = cv::calibrateCamera(
        objectPoints, imagePoints, result.imageSize,
        result.params.K, result.params.dist,
        cv::noArray(), cv::noArray()
    );
    result.source = CalibrationResult::Source::Computed;

    std::cout << "[Calibration] Reprojection error: " << result.rmsError << "\n";

    if (debugMode) writeUndistortedImages(images, result.params, config.resultsDir);

    if (!saveCalibration(config.calFile, result.params))
        std::cerr << "[Calibration] Failed to save calibration file " << config.calFile << "\n";

    return result;
}

cv::Mat undistortImage(const cv::Mat& img, const CalibrationParameters& calib) {
    cv::Mat out;
    cv::undistort(img, out, calib.K, calib.dist);
    return out;
}
