#include "collision_engine/danger_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace collision_engine {

namespace {
constexpr double PI = 3.14159265358979323846;
}

DangerLevel dangerLevelFromString(const std::string& name) {
    if (name == "CRITICAL_COLLISION") return DangerLevel::CRITICAL_COLLISION;
    if (name == "HIGH_WARNING") return DangerLevel::HIGH_WARNING;
    if (name == "MODERATE_WARNING") return DangerLevel::MODERATE_WARNING;
    if (name == "LOW_WARNING") return DangerLevel::LOW_WARNING;
    return DangerLevel::SAFE;
}

float DangerFactors::weightedSum() const {
    double total = static_cast<double>(closeness) * DangerScorer::CLOSENESS_WEIGHT
                 + static_cast<double>(relative) * DangerScorer::RELATIVE_WEIGHT
                 + static_cast<double>(position) * DangerScorer::POSITION_WEIGHT
                 + static_cast<double>(gradient) * DangerScorer::GRADIENT_WEIGHT
                 + static_cast<double>(size) * DangerScorer::SIZE_WEIGHT
                 + static_cast<double>(uniformity) * DangerScorer::UNIFORMITY_WEIGHT;
    return static_cast<float>(total);
}

float DangerScorer::closenessScore(float max_depth, const SceneStatistics& scene) {
    float range = scene.max - scene.min;
    float normalized = range > 0.0f ? (max_depth - scene.min) / range : 0.0f;

    if (normalized > 0.95f) return 1.0f;
    if (normalized > 0.85f) return 0.7f;
    if (normalized > 0.75f) return 0.5f;
    if (normalized > 0.65f) return 0.3f;
    return 0.1f;
}

float DangerScorer::relativeScore(float median_depth, const SceneStatistics& scene) {
    float ratio = scene.background_depth > 0.0f ? median_depth / scene.background_depth : 0.0f;

    if (ratio > 2.0f) return 0.8f;
    if (ratio > 1.5f) return 0.5f;
    if (ratio > 1.2f) return 0.3f;
    return 0.1f;
}

float DangerScorer::positionScore(float x, float y, int width, int height) {
    float cx = width / 2.0f;
    float cy = height / 2.0f;

    float dist = std::sqrt((x - cx) * (x - cx) + (y - cy) * (y - cy));
    float max_dist = std::sqrt(cx * cx + cy * cy);
    float score = max_dist > 0.0f ? 1.0f - dist / max_dist : 0.0f;

    // Lower half, central 60% of the width: what the user is walking into.
    bool in_walking_path = y > height * 0.5f && std::fabs(x - cx) < width * 0.3f;
    if (in_walking_path) score *= WALKING_PATH_BOOST;

    return score;
}

float DangerScorer::uniformityScore(float variance) {
    if (variance < 0.01f) return 1.0f;
    if (variance < 0.05f) return 0.7f;
    return 0.3f;
}

DangerLevel DangerScorer::classify(float danger_score) {
    if (danger_score >= CRITICAL_THRESHOLD) return DangerLevel::CRITICAL_COLLISION;
    if (danger_score >= HIGH_THRESHOLD) return DangerLevel::HIGH_WARNING;
    if (danger_score >= MODERATE_THRESHOLD) return DangerLevel::MODERATE_WARNING;
    if (danger_score >= LOW_THRESHOLD) return DangerLevel::LOW_WARNING;
    return DangerLevel::SAFE;
}

std::string DangerScorer::direction(float x, float y, int width, int height) {
    float offset_x = x - width / 2.0f;

    std::string dir;
    if (std::fabs(offset_x) < width * 0.2f) {
        dir = "center";
    } else if (offset_x < 0) {
        dir = "left";
    } else {
        dir = "right";
    }

    if (y < height / 3.0f) {
        dir += " top";
    } else if (y > 2.0f * height / 3.0f) {
        dir += " bottom";
    }
    return dir;
}

float DangerScorer::angle(float x, float y, int width, int height) {
    double offset_x = x - width / 2.0;
    double offset_y = y - height / 2.0;
    return static_cast<float>(std::atan2(offset_x, std::fabs(offset_y)) * 180.0 / PI);
}

std::string DangerScorer::formatReason(const DangerFactors& f, float total) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "Closeness:%.8f Relative:%.8f Position:%.8f Gradient:%.8f "
                  "Size:%.8f Uniformity:%.8f Total:%.8f",
                  f.closeness, f.relative, f.position, f.gradient,
                  f.size, f.uniformity, total);
    return buf;
}

DangerAssessment DangerScorer::score(const AnalyzedObject& obj,
                                     const SceneStatistics& scene,
                                     const cv::Mat& depth_map) {
    const int width = depth_map.cols;
    const int height = depth_map.rows;

    DangerAssessment result;
    DangerFactors& f = result.factors;

    f.closeness = closenessScore(obj.max_depth, scene);
    f.relative = relativeScore(obj.median_depth, scene);
    f.position = positionScore(obj.center_x, obj.center_y, width, height);
    f.gradient = std::min(1.0f, obj.depth_gradient * 3.0f);

    // Area of the box as detected, including any part outside the frame.
    double box_w = static_cast<double>(obj.bbox.x2) - obj.bbox.x1;
    double box_h = static_cast<double>(obj.bbox.y2) - obj.bbox.y1;
    double box_area = (box_w > 0.0 && box_h > 0.0) ? box_w * box_h : 0.0;
    double frame_area = static_cast<double>(width) * height;
    f.size = frame_area > 0.0
        ? static_cast<float>(std::min(1.0, box_area / frame_area * 5.0))
        : 0.0f;

    f.uniformity = uniformityScore(obj.depth_variance);

    result.score = f.weightedSum();
    if (!std::isfinite(result.score)) result.score = 0.0f;

    result.level = classify(result.score);
    result.reason = formatReason(f, result.score);
    return result;
}

} // namespace collision_engine
