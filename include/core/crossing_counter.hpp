#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "core/boundary.hpp"
#include "core/track.hpp"

namespace pcc {

// Entering = moved onto the boundary's positive side, Exiting = moved onto the negative side
enum class Direction {
  Entering,
  Exiting
};

const char* ToString(Direction d);

// Immutable record of one crossing. frame_id is the frame whose observation completed the crossing
struct CountEvent {
  TrackId track_id{0};
  Direction direction{Direction::Entering};
  std::uint64_t frame_id{0};
  cv::Point2f position;
};

struct CountTotals {
  std::uint64_t total{0};
  std::uint64_t entered{0};
  std::uint64_t exited{0};

  // People currently on the positive side, negative means the count went wrong somewhere
  std::int64_t occupancy() const {
    return static_cast<std::int64_t>(entered) - static_cast<std::int64_t>(exited);
  }
};

/*
    CrossingCounter turns confirmed trajectories into count events.

    Every recorded centroid is classified against the boundary (+1, -1, or 0 inside the dead band). A crossing is
    a change between two definite sides. Per track we remember the last definite side and the last history
    entry already looked at, so each observation is classified exactly once and stale history never
    re-triggers. Tentative and lost periods are caught up on the first evaluation after the track is confirmed.
*/
class CrossingCounter {
public:
  explicit CrossingCounter(Boundary boundary);

  // No-op for anything but a Confirmed track
  std::vector<CountEvent> evaluate(const Track& track);

  // Drop the side memory of a track that left the live set
  void forget(TrackId id);

  const CountTotals& totals() const { return totals_; }
  std::size_t tracked() const { return memory_.size(); }

private:
  struct SideMemory {
    int last_side{0};
    std::uint64_t last_seq{0};
  };

  Boundary boundary_;
  std::unordered_map<TrackId, SideMemory> memory_;
  CountTotals totals_{};
};

} // namespace pcc
