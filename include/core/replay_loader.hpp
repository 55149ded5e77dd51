#pragma once

#include <string>
#include <vector>

#include "core/detections.hpp"

namespace pcc {

/*
    Recorded detector output, one entry per frame:

      frames:
        - frame_id: 0            # optional, defaults to the entry's position
          timestamp_ms: 0        # optional
          detections:
            - {x: 10, y: 10, width: 20, height: 20, confidence: 0.9, embedding: [0.1, 0.2]}

    Values are taken as-is, malformed boxes are left for the pipeline to reject. Structural problems
    (missing keys, wrong types) throw std::runtime_error naming the key path.
*/
std::vector<Detections> LoadDetectionsFromYamlFile(const std::string& path);
std::vector<Detections> LoadDetectionsFromYamlString(const std::string& yaml);

} // namespace pcc
