#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "collision_engine/collision_analyzer.hpp"
#include "collision_engine/analysis_pipeline.hpp"
#include "collision_engine/danger_scorer.hpp"
#include "collision_engine/depth_preprocessor.hpp"
#include "collision_engine/scene_analyzer.hpp"

#include <cstring>

namespace py = pybind11;
using namespace collision_engine;

using DepthArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

// Wraps the numpy buffer without copying; the array must outlive the Mat.
cv::Mat numpy_to_depth(DepthArray& arr) {
    py::buffer_info buf = arr.request();
    if (buf.ndim != 2) throw std::runtime_error("Expected 2D depth array (H, W)");
    if (buf.size == 0) return cv::Mat();
    return cv::Mat(static_cast<int>(buf.shape[0]), static_cast<int>(buf.shape[1]), CV_32FC1, buf.ptr);
}

py::array_t<float> depth_to_numpy(const cv::Mat& depth) {
    py::array_t<float> arr({depth.rows, depth.cols});
    auto buf = arr.request();
    float* dst = static_cast<float*>(buf.ptr);
    for (int y = 0; y < depth.rows; ++y) {
        std::memcpy(dst + static_cast<size_t>(y) * depth.cols, depth.ptr<float>(y), depth.cols * sizeof(float));
    }
    return arr;
}

PYBIND11_MODULE(collision_engine, m) {
    m.doc() = "Relative collision detection over monocular depth maps";

    py::enum_<DangerLevel>(m, "DangerLevel")
        .value("SAFE", DangerLevel::SAFE)
        .value("LOW_WARNING", DangerLevel::LOW_WARNING)
        .value("MODERATE_WARNING", DangerLevel::MODERATE_WARNING)
        .value("HIGH_WARNING", DangerLevel::HIGH_WARNING)
        .value("CRITICAL_COLLISION", DangerLevel::CRITICAL_COLLISION);

    py::class_<BoundingBox>(m, "BoundingBox")
        .def(py::init<>())
        .def(py::init<int, int, int, int>(), py::arg("x1"), py::arg("y1"), py::arg("x2"), py::arg("y2"))
        .def_readwrite("x1", &BoundingBox::x1)
        .def_readwrite("y1", &BoundingBox::y1)
        .def_readwrite("x2", &BoundingBox::x2)
        .def_readwrite("y2", &BoundingBox::y2)
        .def("__repr__", [](const BoundingBox& b) {
            return "<BoundingBox [" + std::to_string(b.x1) + ", " + std::to_string(b.y1) + ", "
                + std::to_string(b.x2) + ", " + std::to_string(b.y2) + "]>";
        });

    py::class_<LabeledObject>(m, "LabeledObject")
        .def(py::init<>())
        .def(py::init<const std::string&, const std::string&, const BoundingBox&, float>(),
             py::arg("object_id"), py::arg("label"), py::arg("bbox"),
             py::arg("detection_confidence") = 0.0f)
        .def_readwrite("object_id", &LabeledObject::object_id)
        .def_readwrite("label", &LabeledObject::label)
        .def_readwrite("bbox", &LabeledObject::bbox)
        .def_readwrite("detection_confidence", &LabeledObject::detection_confidence);

    py::class_<SceneStatistics>(m, "SceneStatistics")
        .def_readonly("min", &SceneStatistics::min)
        .def_readonly("max", &SceneStatistics::max)
        .def_readonly("p25", &SceneStatistics::p25)
        .def_readonly("p50", &SceneStatistics::p50)
        .def_readonly("p75", &SceneStatistics::p75)
        .def_readonly("p90", &SceneStatistics::p90)
        .def_readonly("background_depth", &SceneStatistics::background_depth)
        .def_readonly("foreground_threshold", &SceneStatistics::foreground_threshold);

    py::class_<AnalyzedObject>(m, "AnalyzedObject")
        .def_readonly("object_id", &AnalyzedObject::object_id)
        .def_readonly("label", &AnalyzedObject::label)
        .def_readonly("bbox", &AnalyzedObject::bbox)
        .def_readonly("detection_confidence", &AnalyzedObject::detection_confidence)
        .def_readonly("center_x", &AnalyzedObject::center_x)
        .def_readonly("center_y", &AnalyzedObject::center_y)
        .def_readonly("max_depth", &AnalyzedObject::max_depth)
        .def_readonly("median_depth", &AnalyzedObject::median_depth)
        .def_readonly("depth_variance", &AnalyzedObject::depth_variance)
        .def_readonly("depth_gradient", &AnalyzedObject::depth_gradient)
        .def_readonly("direction", &AnalyzedObject::direction)
        .def_readonly("angle_deg", &AnalyzedObject::angle_deg)
        .def_readonly("danger_level", &AnalyzedObject::danger_level)
        .def_readonly("confidence_score", &AnalyzedObject::confidence_score)
        .def_readonly("reason_for_danger", &AnalyzedObject::reason_for_danger)
        .def("__repr__", [](const AnalyzedObject& o) {
            return "<AnalyzedObject " + o.label + " " + dangerLevelToString(o.danger_level)
                + " score=" + std::to_string(o.confidence_score) + ">";
        });

    py::class_<AnalysisResult>(m, "AnalysisResult")
        .def_readonly("success", &AnalysisResult::success)
        .def_readonly("error", &AnalysisResult::error)
        .def_readonly("objects", &AnalysisResult::objects);

    py::class_<AnalyzerConfig>(m, "AnalyzerConfig")
        .def(py::init<>())
        .def(py::init<int, size_t>(), py::arg("num_threads"), py::arg("parallel_min_objects") = 32)
        .def_readwrite("num_threads", &AnalyzerConfig::num_threads)
        .def_readwrite("parallel_min_objects", &AnalyzerConfig::parallel_min_objects);

    py::class_<CollisionAnalyzer>(m, "CollisionAnalyzer")
        .def(py::init<>())
        .def(py::init<const AnalyzerConfig&>())
        .def("analyze", [](const CollisionAnalyzer& self, DepthArray& depth,
                           const std::vector<LabeledObject>& objects) {
            cv::Mat mat = numpy_to_depth(depth);
            py::gil_scoped_release release;
            return self.analyze(mat, objects);
        }, py::arg("depth_map"), py::arg("objects"));

    m.def("analyze_scene", [](DepthArray& depth) -> py::object {
        cv::Mat mat = numpy_to_depth(depth);
        auto stats = SceneAnalyzer::analyze(mat);
        if (!stats) return py::none();
        return py::cast(*stats);
    }, py::arg("depth_map"));

    m.def("normalize_depth", [](py::array raw) {
        if (raw.ndim() != 2) throw std::runtime_error("Expected 2D depth array (H, W)");
        if (raw.dtype().is(py::dtype::of<uint8_t>())) {
            auto bytes = py::array_t<uint8_t, py::array::c_style | py::array::forcecast>::ensure(raw);
            cv::Mat mat(static_cast<int>(bytes.shape(0)), static_cast<int>(bytes.shape(1)),
                        CV_8UC1, bytes.mutable_data());
            return depth_to_numpy(DepthPreprocessor::normalize(mat));
        }
        DepthArray values = DepthArray::ensure(raw);
        if (!values) throw std::runtime_error("Depth array is not convertible to float32");
        cv::Mat mat = numpy_to_depth(values);
        return depth_to_numpy(DepthPreprocessor::normalize(mat));
    }, py::arg("raw"));

    m.def("classify", &DangerScorer::classify, py::arg("danger_score"));

    py::class_<FrameAnalysis>(m, "FrameAnalysis")
        .def(py::init<>())
        .def_readonly("result", &FrameAnalysis::result)
        .def_readonly("frame_id", &FrameAnalysis::frame_id)
        .def_readonly("analysis_time_ms", &FrameAnalysis::analysis_time_ms);

    py::class_<AnalysisPipeline>(m, "AnalysisPipeline")
        .def(py::init<>())
        .def(py::init<const AnalyzerConfig&>())
        .def("start", &AnalysisPipeline::start)
        .def("stop", [](AnalysisPipeline& self) {
            py::gil_scoped_release release;
            self.stop();
        })
        .def("is_running", &AnalysisPipeline::isRunning)
        .def("submit", [](AnalysisPipeline& self, DepthArray& depth,
                          const std::vector<LabeledObject>& objects) {
            cv::Mat mat = numpy_to_depth(depth);
            return self.submit(mat, objects);
        })
        .def("get_input_queue_size", &AnalysisPipeline::getInputQueueSize)
        .def("get_result_queue_size", &AnalysisPipeline::getResultQueueSize)
        .def("dropped_frames", &AnalysisPipeline::droppedFrames)
        .def("dropped_results", &AnalysisPipeline::droppedResults)
        .def("set_max_input_queue_size", &AnalysisPipeline::setMaxInputQueueSize)
        .def("set_max_result_queue_size", &AnalysisPipeline::setMaxResultQueueSize)
        .def("get_result", [](AnalysisPipeline& self) -> py::object {
            FrameAnalysis result;
            bool got;
            {
                py::gil_scoped_release release;
                got = self.getResult(result);
            }
            if (!got) return py::none();
            return py::cast(result);
        })
        .def("try_get_result", [](AnalysisPipeline& self) -> py::object {
            FrameAnalysis result;
            if (!self.tryGetResult(result)) return py::none();
            return py::cast(result);
        });
}
