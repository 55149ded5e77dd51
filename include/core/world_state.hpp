#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "core/crossing_counter.hpp"
#include "core/detections.hpp"
#include "core/track.hpp"
#include "core/track_manager.hpp"

namespace pcc {

// Read-only copy of one track, safe to hand to other threads
struct TrackView {
  TrackId id{0};
  TrackState state{TrackState::Tentative};
  BBox bbox;
  cv::Point2f velocity;
  float uncertainty{0.f};
  int age_frames{0};
  int hits{0};
  int time_since_update{0};
};

// Everything observers may look at, taken between cycles
struct WorldState {
  std::uint64_t frame_id{0};
  SteadyTP timestamp{};
  std::uint64_t frames_processed{0};

  std::vector<TrackView> tracks;
  TrackStateCounts track_counts{};
  CountTotals totals{};
};

} // namespace pcc
