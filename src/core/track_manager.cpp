#include "core/track_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/geometry.hpp"

namespace pcc {

const char* ToString(TrackState s) {
  switch (s) {
    case TrackState::Tentative: return "tentative";
    case TrackState::Confirmed: return "confirmed";
    case TrackState::Lost: return "lost";
    case TrackState::Deleted: return "deleted";
  }
  return "unknown";
}

TrackManager::TrackManager(TrackingConfig cfg) : cfg_(std::move(cfg)) {}

Track& TrackManager::checked(std::size_t index, const char* op) {
  if (index >= tracks_.size()) {
    throw std::logic_error(std::string("TrackManager::") + op + ": index " + std::to_string(index) + " out of range");
  }
  Track& t = tracks_[index];
  if (t.state == TrackState::Deleted) {
    throw std::logic_error(std::string("TrackManager::") + op + ": track " + std::to_string(t.id) + " is deleted");
  }
  return t;
}

void TrackManager::record(Track& t, const Detection& det, std::uint64_t frame_id) {
  t.history.push_back(HistoryEntry{++t.observations, frame_id, Centroid(det.bbox)});
  while (t.history.size() > static_cast<std::size_t>(cfg_.history_length)) t.history.pop_front();

  // Keep the last embedding we saw when the detector skipped one this frame
  if (det.embedding) t.embedding = det.embedding;
  t.confidence = det.confidence;
  t.last_update_frame_id = frame_id;
}

void TrackManager::predict() {
  for (auto& t : tracks_) {
    if (!t.live()) continue;
    t.motion.predict();
    ++t.age_frames;
  }
}

TrackId TrackManager::spawn(const Detection& det, std::uint64_t frame_id) {
  const TrackId id = next_id_++;
  tracks_.emplace_back(id, det, frame_id, cfg_.kalman);

  Track& t = tracks_.back();
  record(t, det, frame_id);
  if (t.hits >= cfg_.min_confirmed_frames) t.state = TrackState::Confirmed;
  return id;
}

void TrackManager::update(std::size_t index, const Detection& det, std::uint64_t frame_id) {
  Track& t = checked(index, "update");

  t.motion.update(det.bbox);
  ++t.hits;
  t.time_since_update = 0;
  record(t, det, frame_id);

  if (t.state == TrackState::Lost) {
    t.state = TrackState::Confirmed;
  } else if (t.state == TrackState::Tentative && t.hits >= cfg_.min_confirmed_frames) {
    t.state = TrackState::Confirmed;
  }
}

void TrackManager::mark_missed(std::size_t index) {
  Track& t = checked(index, "mark_missed");

  ++t.time_since_update;
  t.hits = 0;

  switch (t.state) {
    case TrackState::Tentative:
      t.state = TrackState::Deleted;
      break;
    case TrackState::Confirmed:
      if (t.time_since_update > cfg_.max_missed_frames) t.state = TrackState::Lost;
      break;
    default:
      break;
  }
}

std::vector<TrackId> TrackManager::sweep() {
  const int delete_after = cfg_.max_missed_frames + cfg_.lost_grace_frames;

  std::vector<TrackId> removed;
  for (auto& t : tracks_) {
    if (t.state == TrackState::Lost && t.time_since_update > delete_after) t.state = TrackState::Deleted;
    if (t.state == TrackState::Deleted) removed.push_back(t.id);
  }

  tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                               [](const Track& t) { return t.state == TrackState::Deleted; }),
                tracks_.end());
  return removed;
}

const Track* TrackManager::find(TrackId id) const {
  auto it = std::lower_bound(tracks_.begin(), tracks_.end(), id,
                             [](const Track& t, TrackId v) { return t.id < v; });
  if (it == tracks_.end() || it->id != id) return nullptr;
  return &*it;
}

TrackStateCounts TrackManager::counts() const {
  TrackStateCounts c;
  for (const auto& t : tracks_) {
    switch (t.state) {
      case TrackState::Tentative: ++c.tentative; break;
      case TrackState::Confirmed: ++c.confirmed; break;
      case TrackState::Lost: ++c.lost; break;
      case TrackState::Deleted: break;
    }
  }
  return c;
}

} // namespace pcc
