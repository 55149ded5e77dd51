#include "core/boundary.hpp"

#include <cmath>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace pcc {

namespace {

// Positive on the right-hand side of A->B when y grows downward
struct SignedDistanceVisitor {
  cv::Point2f p;

  double operator()(const LineBoundary& line) const {
    const double dx = static_cast<double>(line.b.x) - line.a.x;
    const double dy = static_cast<double>(line.b.y) - line.a.y;
    const double len = std::sqrt(dx * dx + dy * dy);
    if (len == 0.0) return 0.0;
    const double cross = dx * (static_cast<double>(p.y) - line.a.y) - dy * (static_cast<double>(p.x) - line.a.x);
    return cross / len;
  }

  // pointPolygonTest measures the distance to the nearest edge, positive inside
  double operator()(const PolygonBoundary& poly) const {
    return cv::pointPolygonTest(poly.vertices, p, true);
  }
};

} // namespace

Boundary::Boundary(BoundaryShape shape, bool flip_sign, float dead_band)
    : shape_(std::move(shape)), flip_sign_(flip_sign), dead_band_(dead_band) {}

double Boundary::signed_distance(const cv::Point2f& p) const {
  const double d = std::visit(SignedDistanceVisitor{p}, shape_);
  return flip_sign_ ? -d : d;
}

int Boundary::side(const cv::Point2f& p) const {
  const double d = signed_distance(p);
  if (d > dead_band_) return 1;
  if (d < -dead_band_) return -1;
  return 0;
}

Boundary MakeBoundary(const BoundaryConfig& cfg) {
  std::vector<cv::Point2f> pts;
  pts.reserve(cfg.points.size());
  for (const auto& p : cfg.points) pts.emplace_back(p.x, p.y);

  if (cfg.type == BoundaryType::Line) {
    const bool flip = (cfg.positive_side == PositiveSide::Left);
    return Boundary(LineBoundary{pts.at(0), pts.at(1)}, flip, cfg.dead_band);
  }

  const bool flip = (cfg.positive_side == PositiveSide::Outside);
  return Boundary(PolygonBoundary{std::move(pts)}, flip, cfg.dead_band);
}

} // namespace pcc
