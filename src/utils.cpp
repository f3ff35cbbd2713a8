#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace utils {

std::vector<std::string> glob(const std::string& dir, const std::string& pattern) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cerr << "[Utils] Not a directory: " << dir << "\n";
        return files;
    }

    std::vector<cv::String> found;
    cv::glob(joinPath(dir, pattern), found, false);
    files.assign(found.begin(), found.end());
    std::sort(files.begin(), files.end());
    return files;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    return (fs::path(dir) / name).string();
}

bool ensureDirectory(const std::string& dir) {
    if (dir.empty()) return true;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[Utils] Could not create " << dir << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool parseInt(const std::string& text, int& value) {
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        return false;
    }
    if (pos != text.size()) return false;
    value = parsed;
    return true;
}

}
