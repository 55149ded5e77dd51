#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/track.hpp"

namespace pcc {

struct TrackStateCounts {
  std::size_t tentative{0};
  std::size_t confirmed{0};
  std::size_t lost{0};

  std::size_t live() const { return tentative + confirmed + lost; }
};

/*
    TrackManager owns every live track and the id counter.

    Lifecycle:
      Tentative --(N consecutive hits)--> Confirmed
      Tentative --(any miss)-----------> Deleted
      Confirmed --(misses > max_missed)--> Lost
      Lost ------(re-matched)----------> Confirmed, same id
      Lost ------(misses > max_missed + lost_grace, on sweep)--> Deleted

    Deleted tracks leave the live set on sweep(). Ids start at 1, only ever increase and are never reissued.
    Tracks are addressed by their index in tracks(), which stays stable until the next sweep().
*/
class TrackManager {
public:
  explicit TrackManager(TrackingConfig cfg);

  TrackManager(const TrackManager&) = delete;
  TrackManager& operator=(const TrackManager&) = delete;

  // Advance every live track's motion model by one frame
  void predict();

  TrackId spawn(const Detection& det, std::uint64_t frame_id);
  void update(std::size_t index, const Detection& det, std::uint64_t frame_id);
  void mark_missed(std::size_t index);

  // Lost tracks past their grace window become Deleted, then all Deleted tracks are dropped. Returns dropped ids
  std::vector<TrackId> sweep();

  const std::vector<Track>& tracks() const { return tracks_; }
  const Track* find(TrackId id) const;
  TrackStateCounts counts() const;

  // Id the next spawned track will get
  TrackId next_id() const { return next_id_; }

private:
  Track& checked(std::size_t index, const char* op);
  void record(Track& t, const Detection& det, std::uint64_t frame_id);

  TrackingConfig cfg_;
  std::vector<Track> tracks_;   // Sorted by id, spawn only appends
  TrackId next_id_{1};
};

} // namespace pcc
