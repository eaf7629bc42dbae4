#pragma once

#include "analyzed_object.hpp"
#include "scene_analyzer.hpp"

#include <opencv2/opencv.hpp>
#include <string>

namespace collision_engine {

struct DangerAssessment {
    DangerLevel level = DangerLevel::SAFE;
    float score = 0.0f;
    DangerFactors factors;
    std::string reason;
};

class DangerScorer {
public:
    static constexpr float CLOSENESS_WEIGHT = 0.35f;
    static constexpr float RELATIVE_WEIGHT = 0.25f;
    static constexpr float POSITION_WEIGHT = 0.20f;
    static constexpr float GRADIENT_WEIGHT = 0.10f;
    static constexpr float SIZE_WEIGHT = 0.05f;
    static constexpr float UNIFORMITY_WEIGHT = 0.05f;

    static constexpr float WALKING_PATH_BOOST = 1.3f;

    static constexpr float CRITICAL_THRESHOLD = 0.75f;
    static constexpr float HIGH_THRESHOLD = 0.55f;
    static constexpr float MODERATE_THRESHOLD = 0.35f;
    static constexpr float LOW_THRESHOLD = 0.20f;

    // Combines the depth statistics already stored in obj with its position
    // and size in the frame. Pure: identical inputs give identical output.
    static DangerAssessment score(const AnalyzedObject& obj,
                                  const SceneStatistics& scene,
                                  const cv::Mat& depth_map);

    // Threshold table, inclusive lower bounds.
    static DangerLevel classify(float danger_score);

    // "left" / "center" / "right", followed by " top" or " bottom" outside the middle third.
    static std::string direction(float x, float y, int width, int height);

    // Signed horizontal bearing in degrees from the frame center, negative to the left.
    static float angle(float x, float y, int width, int height);

    static float closenessScore(float max_depth, const SceneStatistics& scene);
    static float relativeScore(float median_depth, const SceneStatistics& scene);
    static float positionScore(float x, float y, int width, int height);
    static float uniformityScore(float variance);

private:
    static std::string formatReason(const DangerFactors& factors, float total);
};

} // namespace collision_engine
