#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

namespace collision_engine {

// Frame-wide depth calibration. Depth values are unit-less, so "close" is
// always judged against the distribution of the current frame.
struct SceneStatistics {
    float min = 0.0f;
    float max = 0.0f;
    float p25 = 0.0f;
    float p50 = 0.0f;
    float p75 = 0.0f;
    float p90 = 0.0f;
    float background_depth = 0.0f;      // p50
    float foreground_threshold = 0.0f;  // p75 + 0.5 * (p90 - p75)
};

class SceneAnalyzer {
public:
    // Returns nullopt when the map is not a non-empty single-channel float grid
    // or holds no finite value. Non-finite pixels are ignored.
    static std::optional<SceneStatistics> analyze(const cv::Mat& depth_map);

    // True when depth_map can be analyzed: CV_32FC1 with at least one row and column.
    static bool isValidDepthMap(const cv::Mat& depth_map);

private:
    static float percentile(const std::vector<float>& sorted, double p);
};

} // namespace collision_engine
