#include "core/association.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include "core/geometry.hpp"

namespace pcc {

// Small enough to never outweigh a real cost difference, large enough to survive double rounding
static constexpr double kTieBreakEpsilon = 1e-9;

static double Norm(const Embedding& e) {
  double s = 0.0;
  for (float x : e) s += static_cast<double>(x) * x;
  return std::sqrt(s);
}

std::optional<double> AppearanceDistance(const Embedding& a, const Embedding& b, AppearanceMetric metric) {
  if (a.empty() || a.size() != b.size()) return std::nullopt;

  const double na = Norm(a);
  const double nb = Norm(b);
  if (na == 0.0 || nb == 0.0) return std::nullopt;

  if (metric == AppearanceMetric::Cosine) {
    double dot = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) dot += static_cast<double>(a[i]) * b[i];
    const double cos_sim = std::max(-1.0, std::min(1.0, dot / (na * nb)));
    return (1.0 - cos_sim) / 2.0;
  }

  // Euclidean between unit vectors lies in [0, 2]
  double sq = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double d = a[i] / na - b[i] / nb;
    sq += d * d;
  }
  return std::min(1.0, std::sqrt(sq) / 2.0);
}

AssociationEngine::AssociationEngine(AssociationConfig cfg) : cfg_(std::move(cfg)) {}

double AssociationEngine::cost(const Track& track, const Detection& det) const {
  const double geometric = 1.0 - static_cast<double>(IoU(track.motion.box(), det.bbox));

  const double w = cfg_.appearance_weight;
  if (w > 0.0 && track.embedding && det.embedding) {
    const auto app = AppearanceDistance(*track.embedding, *det.embedding, cfg_.metric);
    if (app) return (1.0 - w) * geometric + w * (*app);
  }
  return geometric;
}

CostMatrix AssociationEngine::build_cost_matrix(const std::vector<Track>& tracks, const std::vector<Detection>& dets) const {
  CostMatrix m(tracks.size(), std::vector<double>(dets.size(), kInfeasible));
  for (std::size_t i = 0; i < tracks.size(); ++i) {
    if (!tracks[i].live()) continue;
    for (std::size_t j = 0; j < dets.size(); ++j) {
      const double c = cost(tracks[i], dets[j]);
      if (c <= cfg_.max_cost) m[i][j] = c;
    }
  }
  return m;
}

AssociationResult AssociationEngine::associate(const std::vector<Track>& tracks, const std::vector<Detection>& dets) const {
  AssociationResult out;

  std::vector<std::size_t> live;
  for (std::size_t i = 0; i < tracks.size(); ++i) {
    if (tracks[i].live()) live.push_back(i);
  }

  // Nothing to match against, everything on the non-empty side is unmatched
  if (live.empty() || dets.empty()) {
    out.unmatched_tracks = live;
    out.unmatched_detections.resize(dets.size());
    std::iota(out.unmatched_detections.begin(), out.unmatched_detections.end(), std::size_t{0});
    return out;
  }

  const CostMatrix full = build_cost_matrix(tracks, dets);

  // Rank by id so the tie break doesn't depend on storage order
  std::vector<std::size_t> by_id = live;
  std::sort(by_id.begin(), by_id.end(), [&](std::size_t a, std::size_t b) { return tracks[a].id < tracks[b].id; });

  // Prune rows and columns that have no feasible entry at all
  std::vector<std::size_t> rows;
  std::vector<char> col_feasible(dets.size(), 0);
  for (std::size_t i : by_id) {
    bool any = false;
    for (std::size_t j = 0; j < dets.size(); ++j) {
      if (std::isfinite(full[i][j])) {
        any = true;
        col_feasible[j] = 1;
      }
    }
    if (any) rows.push_back(i);
  }
  std::vector<std::size_t> cols;
  for (std::size_t j = 0; j < dets.size(); ++j) {
    if (col_feasible[j]) cols.push_back(j);
  }

  std::vector<char> track_matched(tracks.size(), 0);
  std::vector<char> det_matched(dets.size(), 0);

  // No feasible pair at all is a normal outcome, everything stays unmatched
  if (!rows.empty()) {
    CostMatrix reduced(rows.size(), std::vector<double>(cols.size(), kInfeasible));
    for (std::size_t r = 0; r < rows.size(); ++r) {
      for (std::size_t c = 0; c < cols.size(); ++c) {
        const double x = full[rows[r]][cols[c]];
        if (std::isfinite(x)) reduced[r][c] = x + kTieBreakEpsilon * static_cast<double>(r);
      }
    }

    const std::vector<int> assignment = SolveAssignment(reduced);
    for (std::size_t r = 0; r < rows.size(); ++r) {
      if (assignment[r] < 0) continue;
      const std::size_t ti = rows[r];
      const std::size_t dj = cols[static_cast<std::size_t>(assignment[r])];
      const double c = full[ti][dj];
      // A forced pairing above the gate is rejected on both sides
      if (!std::isfinite(c) || c > cfg_.max_cost) continue;
      out.matches.push_back(Match{ti, dj, c});
      track_matched[ti] = 1;
      det_matched[dj] = 1;
    }
  }

  std::sort(out.matches.begin(), out.matches.end(),
            [&](const Match& a, const Match& b) { return tracks[a.track_index].id < tracks[b.track_index].id; });

  for (std::size_t i : by_id) {
    if (!track_matched[i]) out.unmatched_tracks.push_back(i);
  }
  for (std::size_t j = 0; j < dets.size(); ++j) {
    if (!det_matched[j]) out.unmatched_detections.push_back(j);
  }
  return out;
}

} // namespace pcc
