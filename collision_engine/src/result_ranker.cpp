#include "collision_engine/result_ranker.hpp"
#include <algorithm>

namespace collision_engine {

std::vector<AnalyzedObject> ResultRanker::rank(std::vector<AnalyzedObject> objects) {
    std::stable_sort(objects.begin(), objects.end(),
                     [](const AnalyzedObject& a, const AnalyzedObject& b) {
        return static_cast<int>(a.danger_level) > static_cast<int>(b.danger_level);
    });
    return objects;
}

} // namespace collision_engine
