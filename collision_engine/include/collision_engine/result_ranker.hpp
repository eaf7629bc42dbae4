#pragma once

#include "analyzed_object.hpp"

#include <vector>

namespace collision_engine {

class ResultRanker {
public:
    // Most dangerous first. Objects with the same level keep their input order;
    // nothing is dropped, SAFE objects included.
    static std::vector<AnalyzedObject> rank(std::vector<AnalyzedObject> objects);
};

} // namespace collision_engine
