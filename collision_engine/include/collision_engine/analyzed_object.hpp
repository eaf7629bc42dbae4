#pragma once

#include "labeled_object.hpp"

#include <string>

namespace collision_engine {

// Ordered by severity: a larger value is more dangerous.
enum class DangerLevel {
    SAFE = 0,
    LOW_WARNING,
    MODERATE_WARNING,
    HIGH_WARNING,
    CRITICAL_COLLISION
};

inline const char* dangerLevelToString(DangerLevel level) {
    switch (level) {
        case DangerLevel::CRITICAL_COLLISION: return "CRITICAL_COLLISION";
        case DangerLevel::HIGH_WARNING: return "HIGH_WARNING";
        case DangerLevel::MODERATE_WARNING: return "MODERATE_WARNING";
        case DangerLevel::LOW_WARNING: return "LOW_WARNING";
        default: return "SAFE";
    }
}

// Unknown names map to SAFE.
DangerLevel dangerLevelFromString(const std::string& name);

// Normalized inputs of the weighted danger score.
struct DangerFactors {
    float closeness = 0.0f;
    float relative = 0.0f;
    float position = 0.0f;     // not clamped, may exceed 1.0 in the walking path
    float gradient = 0.0f;
    float size = 0.0f;
    float uniformity = 0.0f;

    float weightedSum() const;
};

struct AnalyzedObject {
    std::string object_id;
    std::string label;
    BoundingBox bbox;
    float detection_confidence = 0.0f;

    float center_x = 0.0f;
    float center_y = 0.0f;
    float max_depth = 0.0f;       // nearest point inside the box
    float median_depth = 0.0f;
    float depth_variance = 0.0f;
    float depth_gradient = 0.0f;

    std::string direction;
    float angle_deg = 0.0f;

    DangerLevel danger_level = DangerLevel::SAFE;
    float confidence_score = 0.0f;  // the danger score itself
    DangerFactors factors;
    std::string reason_for_danger;

    AnalyzedObject() = default;

    explicit AnalyzedObject(const LabeledObject& obj)
        : object_id(obj.object_id)
        , label(obj.label)
        , bbox(obj.bbox)
        , detection_confidence(obj.detection_confidence) {}
};

} // namespace collision_engine
