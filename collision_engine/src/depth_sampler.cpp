#include "collision_engine/depth_sampler.hpp"
#include <algorithm>
#include <cmath>

namespace collision_engine {

BoundingBox ObjectDepthSampler::clip(const cv::Mat& depth_map, const BoundingBox& bbox) {
    return BoundingBox(
        std::max(0, bbox.x1),
        std::max(0, bbox.y1),
        std::min(bbox.x2, depth_map.cols - 1),
        std::min(bbox.y2, depth_map.rows - 1)
    );
}

cv::Point2f ObjectDepthSampler::center(const cv::Mat& depth_map, const BoundingBox& bbox) {
    int max_x = std::max(0, depth_map.cols - 1);
    int max_y = std::max(0, depth_map.rows - 1);

    int x1 = std::max(0, std::min(bbox.x1, max_x));
    int y1 = std::max(0, std::min(bbox.y1, max_y));
    int x2 = std::max(0, std::min(bbox.x2, max_x));
    int y2 = std::max(0, std::min(bbox.y2, max_y));

    return cv::Point2f((x1 + x2) / 2.0f, (y1 + y2) / 2.0f);
}

float ObjectDepthSampler::localGradient(const cv::Mat& depth_map, int x, int y) {
    if (x < 1 || x >= depth_map.cols - 1 || y < 1 || y >= depth_map.rows - 1) {
        return 0.0f;
    }

    const float* up = depth_map.ptr<float>(y - 1);
    const float* mid = depth_map.ptr<float>(y);
    const float* down = depth_map.ptr<float>(y + 1);

    float gx = -up[x - 1]       + up[x + 1]
               - 2 * mid[x - 1] + 2 * mid[x + 1]
               - down[x - 1]    + down[x + 1];

    float gy = -up[x - 1]   - 2 * up[x]   - up[x + 1]
               + down[x - 1] + 2 * down[x] + down[x + 1];

    float magnitude = std::sqrt(gx * gx + gy * gy) / 8.0f;
    return std::isfinite(magnitude) ? magnitude : 0.0f;
}

DepthSample ObjectDepthSampler::sample(const cv::Mat& depth_map, const BoundingBox& bbox) {
    DepthSample result;

    cv::Point2f c = center(depth_map, bbox);
    result.center_x = c.x;
    result.center_y = c.y;

    // Zero-area input boxes are degenerate; otherwise only an empty clipped range is.
    if (bbox.area() == 0) return result;

    BoundingBox box = clip(depth_map, bbox);
    if (box.x1 > box.x2 || box.y1 > box.y2) return result;

    result.samples.reserve(static_cast<size_t>(box.width() + 1) * (box.height() + 1));
    for (int y = box.y1; y <= box.y2; ++y) {
        const float* row = depth_map.ptr<float>(y);
        for (int x = box.x1; x <= box.x2; ++x) {
            if (std::isfinite(row[x])) result.samples.push_back(row[x]);
        }
    }
    if (result.samples.empty()) return result;

    std::sort(result.samples.begin(), result.samples.end());

    const size_t n = result.samples.size();
    result.max_depth = result.samples.back();
    result.median_depth = result.samples[n / 2];

    double mean = 0.0;
    for (float d : result.samples) mean += d;
    mean /= n;

    double variance = 0.0;
    for (float d : result.samples) variance += (d - mean) * (d - mean);
    result.variance = static_cast<float>(variance / n);

    result.gradient = localGradient(depth_map,
                                    static_cast<int>(std::floor(c.x)),
                                    static_cast<int>(std::floor(c.y)));
    return result;
}

} // namespace collision_engine
