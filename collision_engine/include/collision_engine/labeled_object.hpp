#pragma once

#include <string>

namespace collision_engine {

// Inclusive pixel corners [x1, y1, x2, y2] in depth-map coordinates.
struct BoundingBox {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    BoundingBox() = default;

    BoundingBox(int x1, int y1, int x2, int y2)
        : x1(x1), y1(y1), x2(x2), y2(y2) {}

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    int area() const { return (x2 > x1 && y2 > y1) ? width() * height() : 0; }
};

struct LabeledObject {
    std::string object_id;
    std::string label;
    BoundingBox bbox;
    float detection_confidence = 0.0f;

    LabeledObject() = default;

    LabeledObject(const std::string& id, const std::string& lbl, const BoundingBox& box, float conf)
        : object_id(id), label(lbl), bbox(box), detection_confidence(conf) {}
};

} // namespace collision_engine
