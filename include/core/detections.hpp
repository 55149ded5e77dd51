#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace pcc {

using SteadyTP = std::chrono::steady_clock::time_point;

// Axis-aligned box, (x, y) is the top-left corner, image coordinates with y growing downward
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
};

using Embedding = std::vector<float>;

// A singular Detection, location in the frame with a specified bounding box size, the confidence, and
// an appearance embedding when the detector produces one
struct Detection {
  BBox bbox;
  float confidence{0.f};
  std::optional<Embedding> embedding;
};

// Everything the detector produced for one frame. The frame index is the only thing the counter needs from the frame source
struct Detections {
  std::uint64_t source_frame_id{0};
  SteadyTP capture_time{};
  std::vector<Detection> items;
};

} // namespace pcc
