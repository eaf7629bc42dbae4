#pragma once

#include <cstddef>

namespace collision_engine {

struct AnalyzerConfig {
    // Worker threads used for per-object scoring. 1 keeps everything on the caller thread.
    int num_threads = 1;
    // Frames with fewer objects than this are always scored serially.
    std::size_t parallel_min_objects = 32;

    AnalyzerConfig() = default;

    AnalyzerConfig(int threads, std::size_t min_objects = 32)
        : num_threads(threads)
        , parallel_min_objects(min_objects) {}
};

} // namespace collision_engine
