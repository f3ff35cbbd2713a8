#include "debug_compositor.hpp"
#include "errors.hpp"
#include <algorithm>

cv::Mat composeDebugImage(DebugImageMap& imgs) {
    auto finalIt = imgs.find("final");
    if (finalIt == imgs.end())
        throw MissingFinalStageError("debug images have no \"final\" stage");
    if (finalIt->second.empty())
        throw MissingFinalStageError("\"final\" stage is empty");

    const cv::Size tile = finalIt->second.size();
    const int scale = (int)imgs.size() + 1;
    cv::Mat output = cv::Mat::zeros(tile.height * scale, tile.width, CV_8UC3);

    // band 0 is left empty, stages start at band 1
    int i = 1;
    for (auto& entry : imgs) {
        cv::Mat& img = entry.second;
        int band = i++;
        if (img.empty()) continue;

        if (img.channels() == 1)
            cv::cvtColor(img, img, cv::COLOR_GRAY2BGR);
        CV_Assert(img.channels() == 3);

        // float stages are taken as [0,1] intensities
        cv::Mat stage = img;
        if (img.depth() == CV_32F || img.depth() == CV_64F)
            img.convertTo(stage, CV_8U, 255.0);
        else if (img.depth() != CV_8U)
            img.convertTo(stage, CV_8U);

        // smaller stages leave black residue, larger ones are cropped
        int rows = std::min(stage.rows, tile.height);
        int cols = std::min(stage.cols, tile.width);
        stage(cv::Rect(0, 0, cols, rows))
            .copyTo(output(cv::Rect(0, band * tile.height, cols, rows)));
    }

    return output;
}
