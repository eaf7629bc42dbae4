#pragma once

#include "analyzer_config.hpp"
#include "analyzed_object.hpp"
#include "labeled_object.hpp"
#include "scene_analyzer.hpp"

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace collision_engine {

struct AnalysisResult {
    bool success = false;
    std::string error;                    // set when success is false
    std::vector<AnalyzedObject> objects;  // most dangerous first
};

// Entry point of the engine. Holds only its configuration, so one instance
// can be shared between threads.
class CollisionAnalyzer {
public:
    CollisionAnalyzer();
    explicit CollisionAnalyzer(const AnalyzerConfig& config);

    // depth_map: CV_32FC1 inverse depth in [0,1], same pixel space as the boxes.
    // Fails only on a malformed depth map; bad boxes produce zero statistics.
    AnalysisResult analyze(const cv::Mat& depth_map,
                           const std::vector<LabeledObject>& objects) const;

    // Samples, locates and scores one object against precomputed scene statistics.
    static AnalyzedObject analyzeObject(const cv::Mat& depth_map,
                                        const LabeledObject& object,
                                        const SceneStatistics& scene);

    const AnalyzerConfig& getConfig() const { return config_; }

private:
    void scoreParallel(const cv::Mat& depth_map,
                       const std::vector<LabeledObject>& objects,
                       const SceneStatistics& scene,
                       std::vector<AnalyzedObject>& out) const;

    AnalyzerConfig config_;
};

} // namespace collision_engine
