#include "collision_engine/collision_analyzer.hpp"
#include "collision_engine/danger_scorer.hpp"
#include "collision_engine/depth_sampler.hpp"
#include "collision_engine/result_ranker.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>

namespace collision_engine {

CollisionAnalyzer::CollisionAnalyzer() = default;

CollisionAnalyzer::CollisionAnalyzer(const AnalyzerConfig& config)
    : config_(config) {}

AnalyzedObject CollisionAnalyzer::analyzeObject(const cv::Mat& depth_map,
                                                const LabeledObject& object,
                                                const SceneStatistics& scene) {
    AnalyzedObject obj(object);

    DepthSample sample = ObjectDepthSampler::sample(depth_map, object.bbox);
    obj.center_x = sample.center_x;
    obj.center_y = sample.center_y;
    obj.max_depth = sample.max_depth;
    obj.median_depth = sample.median_depth;
    obj.depth_variance = sample.variance;
    obj.depth_gradient = sample.gradient;

    obj.direction = DangerScorer::direction(obj.center_x, obj.center_y, depth_map.cols, depth_map.rows);
    obj.angle_deg = DangerScorer::angle(obj.center_x, obj.center_y, depth_map.cols, depth_map.rows);

    DangerAssessment assessment = DangerScorer::score(obj, scene, depth_map);
    obj.danger_level = assessment.level;
    obj.confidence_score = assessment.score;
    obj.factors = assessment.factors;
    obj.reason_for_danger = std::move(assessment.reason);

    return obj;
}

void CollisionAnalyzer::scoreParallel(const cv::Mat& depth_map,
                                      const std::vector<LabeledObject>& objects,
                                      const SceneStatistics& scene,
                                      std::vector<AnalyzedObject>& out) const {
    const size_t n = objects.size();
    const size_t workers = std::min(n, static_cast<size_t>(config_.num_threads));
    const size_t chunk = (n + workers - 1) / workers;

    std::vector<std::thread> threads;
    threads.reserve(workers);

    // Slices from serial_begin on are scored on the caller thread.
    size_t serial_begin = n;

    for (size_t w = 0; w < workers; ++w) {
        size_t begin = w * chunk;
        size_t end = std::min(n, begin + chunk);
        if (begin >= end) break;

        // Each worker owns a disjoint slice of out.
        try {
            threads.emplace_back([&, begin, end] {
                for (size_t i = begin; i < end; ++i) {
                    out[i] = analyzeObject(depth_map, objects[i], scene);
                }
            });
        } catch (const std::system_error& e) {
            std::cerr << "[collision_engine] Could not start scoring thread " << w
                      << ": " << e.what() << ", scoring the rest serially" << std::endl;
            serial_begin = begin;
            break;
        }
    }

    for (auto& t : threads) t.join();

    for (size_t i = serial_begin; i < n; ++i) {
        out[i] = analyzeObject(depth_map, objects[i], scene);
    }
}

AnalysisResult CollisionAnalyzer::analyze(const cv::Mat& depth_map,
                                          const std::vector<LabeledObject>& objects) const {
    AnalysisResult result;

    if (!SceneAnalyzer::isValidDepthMap(depth_map)) {
        result.error = "Invalid depth map: expected a non-empty CV_32FC1 grid";
        std::cerr << "[collision_engine] " << result.error
                  << " (got " << depth_map.rows << "x" << depth_map.cols
                  << ", type " << depth_map.type() << ")" << std::endl;
        return result;
    }

    if (objects.empty()) {
        result.success = true;
        return result;
    }

    std::optional<SceneStatistics> scene = SceneAnalyzer::analyze(depth_map);
    if (!scene) {
        result.error = "Invalid depth map: no finite depth values";
        std::cerr << "[collision_engine] " << result.error << std::endl;
        return result;
    }

    std::vector<AnalyzedObject> analyzed(objects.size());

    bool parallel = config_.num_threads > 1 && objects.size() >= config_.parallel_min_objects;
    if (parallel) {
        scoreParallel(depth_map, objects, *scene, analyzed);
    } else {
        for (size_t i = 0; i < objects.size(); ++i) {
            analyzed[i] = analyzeObject(depth_map, objects[i], *scene);
        }
    }

    result.objects = ResultRanker::rank(std::move(analyzed));
    result.success = true;
    return result;
}

} // namespace collision_engine
