#pragma once

#include <opencv2/core.hpp>

#include "core/detections.hpp"

namespace pcc {

inline cv::Point2f Centroid(const BBox& b) {
  return cv::Point2f(b.x + 0.5f * b.w, b.y + 0.5f * b.h);
}

// Box with the given centroid and size
inline BBox BoxFromCentroid(float cx, float cy, float w, float h) {
  return BBox{cx - 0.5f * w, cy - 0.5f * h, w, h};
}

inline float Area(const BBox& b) { return b.w * b.h; }

// Intersection over union, 0 for disjoint or degenerate boxes
float IoU(const BBox& a, const BBox& b);

// True when every component is a finite number
bool IsFinite(const BBox& b);

} // namespace pcc
