#pragma once

#include "labeled_object.hpp"

#include <opencv2/opencv.hpp>
#include <vector>

namespace collision_engine {

struct DepthSample {
    float max_depth = 0.0f;     // highest inverse depth = nearest point
    float median_depth = 0.0f;
    float variance = 0.0f;      // population variance
    float gradient = 0.0f;      // Sobel magnitude / 8 at the box center
    float center_x = 0.0f;
    float center_y = 0.0f;
    std::vector<float> samples; // sorted ascending, empty for degenerate boxes
};

class ObjectDepthSampler {
public:
    // Samples every pixel of the inclusive box range clipped to the map. A
    // zero-area input box, or one lying fully outside the map, yields all-zero
    // statistics and no samples.
    static DepthSample sample(const cv::Mat& depth_map, const BoundingBox& bbox);

    // 3x3 Sobel gradient magnitude divided by 8. Zero within one pixel of an edge.
    static float localGradient(const cv::Mat& depth_map, int x, int y);

    // Intersection of bbox with [0, cols-1] x [0, rows-1]. May be inverted
    // (x1 > x2) when the box lies fully outside the map.
    static BoundingBox clip(const cv::Mat& depth_map, const BoundingBox& bbox);

    // Box center with each corner clamped into the map, so it always lies inside the frame.
    static cv::Point2f center(const cv::Mat& depth_map, const BoundingBox& bbox);
};

} // namespace collision_engine
