#pragma once

#include <cstdint>
#include <vector>

namespace vigil::vision {

/// Raw detector output (boxes, class scores) before decoding.
struct Detections {
  std::vector<float> boxes;  // 4 values per detection, layout per BoxLayout
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace vigil::vision
