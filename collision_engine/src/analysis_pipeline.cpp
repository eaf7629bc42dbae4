#include "collision_engine/analysis_pipeline.hpp"
#include <chrono>
#include <iostream>

namespace collision_engine {

AnalysisPipeline::AnalysisPipeline() = default;

AnalysisPipeline::AnalysisPipeline(const AnalyzerConfig& config)
    : analyzer_(config) {}

AnalysisPipeline::~AnalysisPipeline() {
    stop();
}

bool AnalysisPipeline::start() {
    if (running_) return false;

    // Clear queues
    {
        std::lock_guard<std::mutex> lock(input_mutex_);
        std::queue<FrameInput> empty;
        std::swap(input_queue_, empty);
    }
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        std::queue<FrameAnalysis> empty;
        std::swap(result_queue_, empty);
        worker_done_ = false;
    }

    frame_counter_ = 0;
    dropped_frames_ = 0;
    dropped_results_ = 0;
    running_ = true;

    worker_thread_ = std::thread(&AnalysisPipeline::workerThread, this);
    return true;
}

void AnalysisPipeline::stop() {
    running_ = false;

    input_cv_.notify_all();
    result_cv_.notify_all();

    if (worker_thread_.joinable()) worker_thread_.join();
}

int AnalysisPipeline::submit(const cv::Mat& depth_map, const std::vector<LabeledObject>& objects) {
    if (!running_) return -1;

    int frame_id;
    {
        std::lock_guard<std::mutex> lock(input_mutex_);
        if (input_queue_.size() >= max_input_queue_) {
            ++dropped_frames_;
            return -1;
        }

        frame_id = frame_counter_++;
        // The caller may reuse its buffer for the next frame
        input_queue_.push(FrameInput{depth_map.clone(), objects, frame_id});
    }
    input_cv_.notify_one();
    return frame_id;
}

void AnalysisPipeline::workerThread() {
    while (running_) {
        FrameInput frame;

        {
            std::unique_lock<std::mutex> lock(input_mutex_);

            // Wait with timeout
            if (!input_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
                return !input_queue_.empty() || !running_;
            })) {
                continue;
            }

            if (!running_) break;

            frame = std::move(input_queue_.front());
            input_queue_.pop();
        }

        auto start = std::chrono::high_resolution_clock::now();
        AnalysisResult analysis = analyzer_.analyze(frame.depth_map, frame.objects);
        auto end = std::chrono::high_resolution_clock::now();

        if (!analysis.success) {
            std::cerr << "Frame " << frame.frame_id << " rejected: " << analysis.error << std::endl;
        }

        FrameAnalysis result;
        result.result = std::move(analysis);
        result.frame_id = frame.frame_id;
        result.analysis_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

        {
            std::unique_lock<std::mutex> lock(result_mutex_);

            if (!result_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
                return result_queue_.size() < max_result_queue_ || !running_;
            })) {
                ++dropped_results_;  // consumer is not keeping up
                continue;
            }

            if (!running_) break;

            result_queue_.push(std::move(result));
        }
        result_cv_.notify_one();
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        worker_done_ = true;
    }
    result_cv_.notify_all();
}

bool AnalysisPipeline::getResult(FrameAnalysis& result) {
    std::unique_lock<std::mutex> lock(result_mutex_);
    result_cv_.wait(lock, [this] {
        return !result_queue_.empty() || worker_done_;
    });

    if (result_queue_.empty()) return false;

    result = std::move(result_queue_.front());
    result_queue_.pop();
    result_cv_.notify_one();
    return true;
}

bool AnalysisPipeline::tryGetResult(FrameAnalysis& result) {
    std::lock_guard<std::mutex> lock(result_mutex_);

    if (result_queue_.empty()) return false;

    result = std::move(result_queue_.front());
    result_queue_.pop();
    result_cv_.notify_one();
    return true;
}

size_t AnalysisPipeline::getInputQueueSize() const {
    std::lock_guard<std::mutex> lock(input_mutex_);
    return input_queue_.size();
}

size_t AnalysisPipeline::getResultQueueSize() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_queue_.size();
}

} // namespace collision_engine
