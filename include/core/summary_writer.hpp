#pragma once

#include <chrono>
#include <string>

#include "core/config.hpp"
#include "core/crossing_counter.hpp"
#include "core/world_state.hpp"

namespace pcc {

enum class OccupancyStatus {
  Ok,
  Warning,        // At or above warning_threshold of capacity
  OverCapacity,   // Above critical_threshold of capacity
  Anomaly         // More exits than entries, the count can't be trusted
};

const char* ToString(OccupancyStatus s);

// capacity <= 0 disables the warning and over-capacity checks
OccupancyStatus ClassifyOccupancy(const CountTotals& totals, const OccupancyConfig& cfg);

// Summary document for dashboard readers: entered / exited / current_inside plus track counts and status
std::string EmitSummaryYaml(const WorldState& ws, const OccupancyConfig& occupancy,
                            std::chrono::system_clock::time_point now);

// Writes the summary to 'path' through a temporary file and a rename, so readers never see half a document.
// Creates the parent directory. Throws std::runtime_error when the file can't be written
void WriteSummaryFile(const std::string& path, const WorldState& ws, const OccupancyConfig& occupancy);

} // namespace pcc
