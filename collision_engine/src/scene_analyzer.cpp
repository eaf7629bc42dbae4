#include "collision_engine/scene_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace collision_engine {

bool SceneAnalyzer::isValidDepthMap(const cv::Mat& depth_map) {
    return !depth_map.empty()
        && depth_map.rows > 0
        && depth_map.cols > 0
        && depth_map.type() == CV_32FC1;
}

float SceneAnalyzer::percentile(const std::vector<float>& sorted, double p) {
    const size_t n = sorted.size();
    size_t idx = static_cast<size_t>(std::floor(static_cast<double>(n) * p));
    return sorted[std::min(n - 1, idx)];
}

std::optional<SceneStatistics> SceneAnalyzer::analyze(const cv::Mat& depth_map) {
    if (!isValidDepthMap(depth_map)) return std::nullopt;

    std::vector<float> values;
    values.reserve(depth_map.total());
    for (int y = 0; y < depth_map.rows; ++y) {
        const float* row = depth_map.ptr<float>(y);
        for (int x = 0; x < depth_map.cols; ++x) {
            if (std::isfinite(row[x])) values.push_back(row[x]);
        }
    }
    if (values.empty()) return std::nullopt;

    std::sort(values.begin(), values.end());

    SceneStatistics stats;
    stats.min = values.front();
    stats.max = values.back();
    stats.p25 = percentile(values, 0.25);
    stats.p50 = percentile(values, 0.50);
    stats.p75 = percentile(values, 0.75);
    stats.p90 = percentile(values, 0.90);

    stats.background_depth = stats.p50;
    stats.foreground_threshold = stats.p75 + 0.5f * (stats.p90 - stats.p75);

    return stats;
}

} // namespace collision_engine
