#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/assignment.hpp"
#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/track.hpp"

namespace pcc {

// A track (by index into the list given to associate()) paired with a detection (by index)
struct Match {
  std::size_t track_index{0};
  std::size_t detection_index{0};
  double cost{0.0};
};

struct AssociationResult {
  std::vector<Match> matches;
  std::vector<std::size_t> unmatched_tracks;
  std::vector<std::size_t> unmatched_detections;
};

// Distance between two embeddings in [0, 1], nullopt when they can't be compared (length mismatch, zero vector)
std::optional<double> AppearanceDistance(const Embedding& a, const Embedding& b, AppearanceMetric metric);

/*
    AssociationEngine matches predicted tracks to this frame's detections.

    cost = (1 - w) * (1 - IoU) + w * appearance distance, geometry only when either side lacks an embedding.
    Pairs above max_cost are infeasible and never reach the solver. The remaining problem is solved optimally,
    with ties going to the lower track id.
*/
class AssociationEngine {
public:
  explicit AssociationEngine(AssociationConfig cfg);

  // Raw blended cost, no gating
  double cost(const Track& track, const Detection& det) const;

  // Gated cost matrix, infeasible entries are kInfeasible. Deleted tracks get an all-infeasible row
  CostMatrix build_cost_matrix(const std::vector<Track>& tracks, const std::vector<Detection>& dets) const;

  AssociationResult associate(const std::vector<Track>& tracks, const std::vector<Detection>& dets) const;

private:
  AssociationConfig cfg_;
};

} // namespace pcc
