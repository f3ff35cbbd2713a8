#pragma once
#include "calibration.hpp"
#include <string>

enum class LoadStatus {
    Ok,
    NotFound,
    Corrupt
};

const char* toString(LoadStatus status);

// Writes to a temporary sibling file and renames it over `path`.
bool saveCalibration(const std::string& path, const CalibrationParameters& calib);

// `calib` is only assigned when the result is LoadStatus::Ok.
LoadStatus loadCalibration(const std::string& path, CalibrationParameters& calib);
