#include "core/crossing_counter.hpp"

#include <utility>

namespace pcc {

const char* ToString(Direction d) {
  return d == Direction::Entering ? "entering" : "exiting";
}

CrossingCounter::CrossingCounter(Boundary boundary) : boundary_(std::move(boundary)) {}

std::vector<CountEvent> CrossingCounter::evaluate(const Track& track) {
  std::vector<CountEvent> events;
  if (track.state != TrackState::Confirmed) return events;

  SideMemory& mem = memory_[track.id];

  for (const auto& entry : track.history) {
    if (entry.seq <= mem.last_seq) continue;
    mem.last_seq = entry.seq;

    const int side = boundary_.side(entry.centroid);
    if (side == 0) continue;

    if (mem.last_side != 0 && side != mem.last_side) {
      CountEvent ev;
      ev.track_id = track.id;
      ev.direction = (side > 0) ? Direction::Entering : Direction::Exiting;
      ev.frame_id = entry.frame_id;
      ev.position = entry.centroid;
      events.push_back(ev);

      ++totals_.total;
      if (ev.direction == Direction::Entering) ++totals_.entered;
      else ++totals_.exited;
    }
    mem.last_side = side;
  }

  return events;
}

void CrossingCounter::forget(TrackId id) {
  memory_.erase(id);
}

} // namespace pcc
