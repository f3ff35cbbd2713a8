#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace utils {

// sorted; empty if dir does not exist
std::vector<std::string> glob(const std::string& dir, const std::string& pattern);

std::string joinPath(const std::string& dir, const std::string& name);

bool ensureDirectory(const std::string& dir);

// false unless the whole string is an int; value untouched on failure
bool parseInt(const std::string& text, int& value);

}
