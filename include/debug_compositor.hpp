#pragma once
#include <opencv2/opencv.hpp>
#include <map>
#include <string>

// stage name -> image; std::map keeps keys sorted
using DebugImageMap = std::map<std::string, cv::Mat>;

// Stacks every stage vertically, one "final"-sized band per key in sorted
// order starting at the second band; the first band stays black.
// Gray stages are converted to BGR in place.
cv::Mat composeDebugImage(DebugImageMap& imgs);
