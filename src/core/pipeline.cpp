#include "core/pipeline.hpp"

#include <cmath>
#include <iostream>

#include "core/boundary.hpp"
#include "core/config_loader.hpp"
#include "core/geometry.hpp"

namespace pcc {

// Runs before any member is built, a bad config never gets as far as constructing the boundary
static const AppConfig& Validated(const AppConfig& cfg) {
  ValidateOrThrow(cfg);
  return cfg;
}

std::optional<std::string> ValidateDetection(const Detection& det, const DetectionConfig& cfg) {
  const BBox& b = det.bbox;
  if (!IsFinite(b)) return std::string("non-finite box");
  if (b.w <= 0.f || b.h <= 0.f) return std::string("non-positive size");
  if (!std::isfinite(det.confidence) || det.confidence < 0.f || det.confidence > 1.f)
    return std::string("confidence outside [0, 1]");

  // Partially visible boxes are fine, a box with no pixel inside the frame is not
  if (cfg.frame_width > 0 && cfg.frame_height > 0) {
    if (b.x + b.w <= 0.f || b.y + b.h <= 0.f || b.x >= static_cast<float>(cfg.frame_width) ||
        b.y >= static_cast<float>(cfg.frame_height)) {
      return std::string("box outside the frame");
    }
  }

  if (det.embedding) {
    const Embedding& e = *det.embedding;
    if (e.empty()) return std::string("empty embedding");
    if (cfg.embedding_dim > 0 && e.size() != static_cast<std::size_t>(cfg.embedding_dim)) {
      return "embedding length " + std::to_string(e.size()) + ", expected " + std::to_string(cfg.embedding_dim);
    }
    for (float x : e) {
      if (!std::isfinite(x)) return std::string("non-finite embedding value");
    }
  }

  return std::nullopt;
}

CountingPipeline::CountingPipeline(const AppConfig& cfg)
    : detection_cfg_(Validated(cfg).detection),
      association_(cfg.association),
      tracks_(cfg.tracking),
      counter_(MakeBoundary(cfg.boundary)) {}

std::vector<Detection> CountingPipeline::ingest(const Detections& frame, FrameResult& result) const {
  std::vector<Detection> accepted;
  accepted.reserve(frame.items.size());

  for (std::size_t i = 0; i < frame.items.size(); ++i) {
    const Detection& det = frame.items[i];

    // Malformed input is dropped here, the rest of the cycle never sees it
    const auto reason = ValidateDetection(det, detection_cfg_);
    if (reason) {
      std::cerr << "[counting] frame " << frame.source_frame_id << " detection " << i
                << " rejected: " << *reason << "\n";
      ++result.rejected_detections;
      continue;
    }

    if (det.confidence < detection_cfg_.confidence_min) {
      ++result.filtered_detections;
      continue;
    }

    accepted.push_back(det);
  }

  result.accepted_detections = accepted.size();
  return accepted;
}

FrameResult CountingPipeline::process(const Detections& frame) {
  const std::uint64_t frame_id = frame.source_frame_id;

  FrameResult result;
  result.frame_id = frame_id;

  if (frames_processed_ > 0 && frame_id <= last_frame_id_) {
    std::cerr << "[counting] frame " << frame_id << " arrived after frame " << last_frame_id_
              << ", processing it anyway\n";
  }

  const std::vector<Detection> dets = ingest(frame, result);

  // 1. Predict
  tracks_.predict();

  // 2. Associate
  const AssociationResult assoc = association_.associate(tracks_.tracks(), dets);

  // 3. Matched tracks take their detection
  for (const auto& m : assoc.matches) {
    tracks_.update(m.track_index, dets[m.detection_index], frame_id);
  }

  // 4. Leftover detections start new identities. spawn() only appends, track indices above stay valid
  for (std::size_t j : assoc.unmatched_detections) {
    tracks_.spawn(dets[j], frame_id);
  }

  // 5. Leftover tracks coast on their prediction
  for (std::size_t i : assoc.unmatched_tracks) {
    tracks_.mark_missed(i);
  }

  // 6. Lifecycle sweep, the counter forgets whatever left the live set
  for (TrackId id : tracks_.sweep()) {
    counter_.forget(id);
  }

  // 7. Crossings, once per confirmed track
  for (const auto& t : tracks_.tracks()) {
    std::vector<CountEvent> ev = counter_.evaluate(t);
    result.events.insert(result.events.end(), ev.begin(), ev.end());
  }

  // 8. Report
  result.totals = counter_.totals();
  result.track_counts = tracks_.counts();

  ++frames_processed_;
  last_frame_id_ = frame_id;
  last_capture_time_ = frame.capture_time;
  return result;
}

WorldState CountingPipeline::snapshot() const {
  WorldState ws;
  ws.frame_id = last_frame_id_;
  ws.timestamp = last_capture_time_;
  ws.frames_processed = frames_processed_;

  ws.tracks.reserve(tracks_.tracks().size());
  for (const auto& t : tracks_.tracks()) {
    TrackView v;
    v.id = t.id;
    v.state = t.state;
    v.bbox = t.motion.box();
    v.velocity = t.motion.velocity();
    v.uncertainty = t.motion.uncertainty();
    v.age_frames = t.age_frames;
    v.hits = t.hits;
    v.time_since_update = t.time_since_update;
    ws.tracks.push_back(v);
  }

  ws.track_counts = tracks_.counts();
  ws.totals = counter_.totals();
  return ws;
}

} // namespace pcc
