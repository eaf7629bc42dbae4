#pragma once

#include "analyzer_config.hpp"
#include "collision_analyzer.hpp"
#include "labeled_object.hpp"

#include <opencv2/opencv.hpp>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <vector>

namespace collision_engine {

struct FrameAnalysis {
    AnalysisResult result;
    int frame_id = -1;
    double analysis_time_ms = 0.0;
};

// Runs the analyzer on a worker thread for callers that produce frames on a
// fixed interval. Frames arriving while the input queue is full are skipped.
class AnalysisPipeline {
public:
    AnalysisPipeline();
    explicit AnalysisPipeline(const AnalyzerConfig& config);
    ~AnalysisPipeline();

    // Non-copyable
    AnalysisPipeline(const AnalysisPipeline&) = delete;
    AnalysisPipeline& operator=(const AnalysisPipeline&) = delete;

    bool start();
    void stop();

    // Queue one frame. Returns its frame id, or -1 if the frame was skipped
    // (pipeline stopped or input queue full). Never blocks.
    int submit(const cv::Mat& depth_map, const std::vector<LabeledObject>& objects);

    // Get next result (blocks if not ready, returns false once stopped and drained)
    bool getResult(FrameAnalysis& result);

    // Try to get result without blocking
    bool tryGetResult(FrameAnalysis& result);

    bool isRunning() const { return running_; }

    size_t getInputQueueSize() const;
    size_t getResultQueueSize() const;
    size_t droppedFrames() const { return dropped_frames_; }
    size_t droppedResults() const { return dropped_results_; }

    void setMaxInputQueueSize(size_t size) { max_input_queue_ = size; }
    void setMaxResultQueueSize(size_t size) { max_result_queue_ = size; }

private:
    void workerThread();

    CollisionAnalyzer analyzer_;
    std::thread worker_thread_;

    struct FrameInput {
        cv::Mat depth_map;
        std::vector<LabeledObject> objects;
        int frame_id;
    };
    std::queue<FrameInput> input_queue_;
    mutable std::mutex input_mutex_;
    std::condition_variable input_cv_;

    std::queue<FrameAnalysis> result_queue_;
    mutable std::mutex result_mutex_;
    std::condition_variable result_cv_;

    std::atomic<bool> running_{false};
    bool worker_done_ = true;  // guarded by result_mutex_
    std::atomic<int> frame_counter_{0};
    std::atomic<size_t> dropped_frames_{0};
    std::atomic<size_t> dropped_results_{0};

    std::atomic<size_t> max_input_queue_{4};
    std::atomic<size_t> max_result_queue_{4};
};

} // namespace collision_engine
