#pragma once

#include <variant>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"

namespace pcc {

// Directed segment A->B. The counting line is treated as infinite through A and B
struct LineBoundary {
  cv::Point2f a;
  cv::Point2f b;
};

struct PolygonBoundary {
  std::vector<cv::Point2f> vertices;
};

using BoundaryShape = std::variant<LineBoundary, PolygonBoundary>;

/*
    Boundary is the counting region. Every shape answers the same question: how far is a point from the
    boundary, signed so that the configured positive side is > 0. Side() folds the dead band in, returning
    +1 / -1 for a definite side and 0 for points too close to tell.
*/
class Boundary {
public:
  Boundary(BoundaryShape shape, bool flip_sign, float dead_band);

  double signed_distance(const cv::Point2f& p) const;
  int side(const cv::Point2f& p) const;

  const BoundaryShape& shape() const { return shape_; }
  float dead_band() const { return dead_band_; }

private:
  BoundaryShape shape_;
  bool flip_sign_{false};
  float dead_band_{0.f};
};

// Build the boundary described by an already validated config
Boundary MakeBoundary(const BoundaryConfig& cfg);

} // namespace pcc
