#include "calibration_store.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

const char* toString(LoadStatus status) {
    switch (status) {
    case LoadStatus::Ok:       return "ok";
    case LoadStatus::NotFound: return "not found";
    case LoadStatus::Corrupt:  return "corrupt";
    }
    return "unknown";
}

// keep the extension so FileStorage picks the same format
static fs::path partialPath(const fs::path& path) {
    fs::path tmp = path;
    tmp.replace_filename(path.stem().string() + ".partial" + path.extension().string());
    return tmp;
}

bool saveCalibration(const std::string& path, const CalibrationParameters& calib) {
    if (!calib.valid()) {
        std::cerr << "[CalibrationStore] Refusing to save incomplete calibration\n";
        return false;
    }

    fs::path target(path);
    if (!utils::ensureDirectory(target.parent_path().string())) return false;

    fs::path tmp = partialPath(target);
    try {
        cv::FileStorage file(tmp.string(), cv::FileStorage::WRITE);
        if (!file.isOpened()) {
            std::cerr << "[CalibrationStore] Could not open " << tmp << " for writing\n";
            return false;
        }
        file << "dist_mtx" << calib.K;
        file << "dist_dist" << calib.dist;
        file.release();
    } catch (const cv::Exception& e) {
        std::cerr << "[CalibrationStore] Write failed: " << e.what() << "\n";
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::cerr << "[CalibrationStore] Could not move " << tmp << " to "
                  << target << ": " << ec.message() << "\n";
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

LoadStatus loadCalibration(const std::string& path, CalibrationParameters& calib) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return LoadStatus::NotFound;

    CalibrationParameters loaded;
    try {
        cv::FileStorage file(path, cv::FileStorage::READ);
        if (!file.isOpened()) return LoadStatus::NotFound;

        cv::FileNode mtx = file["dist_mtx"];
        cv::FileNode dist = file["dist_dist"];
        if (mtx.empty() || dist.empty()) return LoadStatus::Corrupt;

        mtx >> loaded.K;
        dist >> loaded.dist;
    } catch (const cv::Exception& e) {
        std::cerr << "[CalibrationStore] Could not parse " << path << ": " << e.what() << "\n";
        return LoadStatus::Corrupt;
    }

    if (loaded.K.rows != 3 || loaded.K.cols != 3 || loaded.dist.empty())
        return LoadStatus::Corrupt;

    calib = loaded;
    return LoadStatus::Ok;
}
