#pragma once

#include "labeled_object.hpp"

#include <opencv2/opencv.hpp>
#include <vector>

namespace collision_engine {

struct LetterboxInfo {
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
};

// Turns collaborator outputs into engine inputs: raw depth-model output into a
// normalized CV_32FC1 map, and detector boxes into depth-map pixel space.
class DepthPreprocessor {
public:
    // CV_8U output is divided by 255; anything else is min-max normalized to [0,1].
    // Only the first channel of a multi-channel input is used. Empty in, empty out.
    static cv::Mat normalize(const cv::Mat& raw);

    // Builds a CV_32FC1 map from nested rows. False on no rows, an empty row or ragged rows.
    static bool fromRows(const std::vector<std::vector<float>>& rows, cv::Mat& out);

    // Scales boxes from a source frame size into the depth map's size.
    static std::vector<LabeledObject> rescaleBoxes(const std::vector<LabeledObject>& objects,
                                                   const cv::Size& source,
                                                   const cv::Size& depth);

    // Geometry of a letterbox resize of src into target_w x target_h.
    static LetterboxInfo letterboxInfo(const cv::Size& src, int target_w, int target_h);

    // Maps boxes detected on a letterboxed input back to the original frame, clamped to it.
    static std::vector<LabeledObject> unletterbox(const std::vector<LabeledObject>& objects,
                                                  const LetterboxInfo& info,
                                                  const cv::Size& frame);
};

} // namespace collision_engine
