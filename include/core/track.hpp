#pragma once

#include <cstdint>
#include <deque>
#include <optional>

#include <opencv2/core.hpp>

#include "core/detections.hpp"
#include "core/motion_predictor.hpp"

namespace pcc {

using TrackId = std::uint64_t;

enum class TrackState {
  Tentative,
  Confirmed,
  Lost,
  Deleted
};

const char* ToString(TrackState s);

// One recorded centroid. seq counts the track's observations, frame_id is the frame it was observed on
struct HistoryEntry {
  std::uint64_t seq{0};
  std::uint64_t frame_id{0};
  cv::Point2f centroid;
};

// A persistent identity. Owned by TrackManager, everything else only looks at it during a cycle
struct Track {
  Track(TrackId id, const Detection& det, std::uint64_t frame_id, const KalmanConfig& kcfg)
      : id(id), motion(det.bbox, kcfg), embedding(det.embedding), confidence(det.confidence),
        last_update_frame_id(frame_id) {}

  TrackId id{0};
  TrackState state{TrackState::Tentative};
  MotionPredictor motion;

  int age_frames{0};          // Frames since creation
  int hits{1};                // Consecutive matched updates, the spawning detection counts as the first
  int time_since_update{0};   // Consecutive misses

  std::deque<HistoryEntry> history;     // Bounded, oldest evicted first
  std::uint64_t observations{0};
  std::optional<Embedding> embedding;   // Last seen appearance
  float confidence{0.f};
  std::uint64_t last_update_frame_id{0};

  bool live() const { return state != TrackState::Deleted; }
};

} // namespace pcc
