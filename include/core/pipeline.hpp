#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/association.hpp"
#include "core/config.hpp"
#include "core/crossing_counter.hpp"
#include "core/detections.hpp"
#include "core/track_manager.hpp"
#include "core/world_state.hpp"

namespace pcc {

// Why a detection can't enter the tracker, nullopt when it is well formed
std::optional<std::string> ValidateDetection(const Detection& det, const DetectionConfig& cfg);

struct FrameResult {
  std::uint64_t frame_id{0};
  std::vector<CountEvent> events;   // New this frame
  CountTotals totals{};             // Running totals after this frame
  TrackStateCounts track_counts{};

  std::size_t accepted_detections{0};
  std::size_t filtered_detections{0};   // Below the confidence minimum
  std::size_t rejected_detections{0};   // Malformed
};

/*
    CountingPipeline is the single owner of all counting state. One call to process() is one full cycle:

      ingest -> predict -> associate -> update matched -> spawn unmatched detections
             -> miss unmatched tracks -> sweep -> evaluate crossings

    Construction validates the config and throws before any frame is seen. Not thread safe, frames must be
    processed one at a time and in order.
*/
class CountingPipeline {
public:
  explicit CountingPipeline(const AppConfig& cfg);

  CountingPipeline(const CountingPipeline&) = delete;
  CountingPipeline& operator=(const CountingPipeline&) = delete;

  FrameResult process(const Detections& frame);

  WorldState snapshot() const;

  const CountTotals& totals() const { return counter_.totals(); }
  TrackStateCounts track_counts() const { return tracks_.counts(); }
  const TrackManager& tracks() const { return tracks_; }
  std::uint64_t frames_processed() const { return frames_processed_; }

private:
  std::vector<Detection> ingest(const Detections& frame, FrameResult& result) const;

  DetectionConfig detection_cfg_;
  AssociationEngine association_;
  TrackManager tracks_;
  CrossingCounter counter_;

  std::uint64_t frames_processed_{0};
  std::uint64_t last_frame_id_{0};
  SteadyTP last_capture_time_{};
};

} // namespace pcc
