#include "collision_engine/depth_preprocessor.hpp"
#include <algorithm>
#include <iostream>

namespace collision_engine {

cv::Mat DepthPreprocessor::normalize(const cv::Mat& raw) {
    if (raw.empty()) return cv::Mat();

    cv::Mat single;
    if (raw.channels() > 1) {
        cv::extractChannel(raw, single, 0);
    } else {
        single = raw;
    }

    cv::Mat depth;
    if (single.depth() == CV_8U) {
        single.convertTo(depth, CV_32F, 1.0 / 255.0);
        return depth;
    }

    single.convertTo(depth, CV_32F);
    cv::patchNaNs(depth, 0.0);

    double min_val = 0.0, max_val = 0.0;
    cv::minMaxLoc(depth, &min_val, &max_val);

    if (max_val > min_val) {
        double range = max_val - min_val;
        depth.convertTo(depth, CV_32F, 1.0 / range, -min_val / range);
    } else {
        // Constant map: nothing to stretch, only keep it inside [0,1]
        cv::Mat floored = cv::max(depth, 0.0);
        depth = cv::min(floored, 1.0);
    }
    return depth;
}

bool DepthPreprocessor::fromRows(const std::vector<std::vector<float>>& rows, cv::Mat& out) {
    if (rows.empty()) return false;

    const size_t width = rows.front().size();
    if (width == 0) return false;

    for (const auto& row : rows) {
        if (row.size() != width) {
            std::cerr << "Ragged depth map: expected rows of " << width
                      << " values, got " << row.size() << std::endl;
            return false;
        }
    }

    out.create(static_cast<int>(rows.size()), static_cast<int>(width), CV_32FC1);
    for (int y = 0; y < out.rows; ++y) {
        std::copy(rows[y].begin(), rows[y].end(), out.ptr<float>(y));
    }
    return true;
}

std::vector<LabeledObject> DepthPreprocessor::rescaleBoxes(const std::vector<LabeledObject>& objects,
                                                           const cv::Size& source,
                                                           const cv::Size& depth) {
    if (source.width <= 0 || source.height <= 0) {
        std::cerr << "Cannot rescale boxes from an empty source frame" << std::endl;
        return objects;
    }

    const float sx = static_cast<float>(depth.width) / source.width;
    const float sy = static_cast<float>(depth.height) / source.height;

    std::vector<LabeledObject> scaled = objects;
    for (auto& obj : scaled) {
        obj.bbox.x1 = static_cast<int>(obj.bbox.x1 * sx);
        obj.bbox.y1 = static_cast<int>(obj.bbox.y1 * sy);
        obj.bbox.x2 = static_cast<int>(obj.bbox.x2 * sx);
        obj.bbox.y2 = static_cast<int>(obj.bbox.y2 * sy);
    }
    return scaled;
}

LetterboxInfo DepthPreprocessor::letterboxInfo(const cv::Size& src, int target_w, int target_h) {
    LetterboxInfo info;
    if (src.width <= 0 || src.height <= 0) return info;

    info.scale = std::min(static_cast<float>(target_h) / src.height,
                          static_cast<float>(target_w) / src.width);

    int new_h = static_cast<int>(src.height * info.scale);
    int new_w = static_cast<int>(src.width * info.scale);

    info.pad_x = (target_w - new_w) / 2;
    info.pad_y = (target_h - new_h) / 2;

    return info;
}

std::vector<LabeledObject> DepthPreprocessor::unletterbox(const std::vector<LabeledObject>& objects,
                                                          const LetterboxInfo& info,
                                                          const cv::Size& frame) {
    if (info.scale <= 0.0f) return objects;

    auto map_x = [&](int v) {
        int x = static_cast<int>((v - info.pad_x) / info.scale);
        return std::max(0, std::min(x, frame.width - 1));
    };
    auto map_y = [&](int v) {
        int y = static_cast<int>((v - info.pad_y) / info.scale);
        return std::max(0, std::min(y, frame.height - 1));
    };

    std::vector<LabeledObject> mapped = objects;
    for (auto& obj : mapped) {
        obj.bbox.x1 = map_x(obj.bbox.x1);
        obj.bbox.y1 = map_y(obj.bbox.y1);
        obj.bbox.x2 = map_x(obj.bbox.x2);
        obj.bbox.y2 = map_y(obj.bbox.y2);
    }
    return mapped;
}

} // namespace collision_engine
