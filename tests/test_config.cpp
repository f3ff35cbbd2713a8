#include "config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using test_helpers::TempDir;

TEST(ConfigTest, DefaultsMatchStandardLayout) {
    PipelineConfig config;
    EXPECT_EQ(config.calDir, "camera_cal");
    EXPECT_EQ(config.resultsDir, "results");
    EXPECT_EQ(config.calFile, "results/calibration_data.yml");
    EXPECT_EQ(config.calPattern, "calibration*.jpg");
}

TEST(ConfigTest, CalFileFollowsResultsDir) {
    TempDir dir;
    const std::string path = dir.file("pipeline.yml");
    {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        fs << "cal_dir" << "/data/cal";
        fs << "results_dir" << "/data/out";
    }

    PipelineConfig config;
    ASSERT_TRUE(loadPipelineConfig(path, config));
    EXPECT_EQ(config.calDir, "/data/cal");
    EXPECT_EQ(config.resultsDir, "/data/out");
    EXPECT_EQ(config.calFile, "/data/out/calibration_data.yml");
    EXPECT_EQ(config.calPattern, "calibration*.jpg");
}

TEST(ConfigTest, ExplicitCalFileWins) {
    TempDir dir;
    const std::string path = dir.file("pipeline.yml");
    {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        fs << "results_dir" << "out";
        fs << "cal_file" << "cache/lens.yml";
        fs << "cal_pattern" << "*.png";
    }

    PipelineConfig config;
    ASSERT_TRUE(loadPipelineConfig(path, config));
    EXPECT_EQ(config.calFile, "cache/lens.yml");
    EXPECT_EQ(config.calPattern, "*.png");
}

TEST(ConfigTest, MissingFileFails) {
    TempDir dir;
    PipelineConfig config;
    EXPECT_FALSE(loadPipelineConfig(dir.file("missing.yml"), config));
    EXPECT_EQ(config.calDir, "camera_cal");
}
