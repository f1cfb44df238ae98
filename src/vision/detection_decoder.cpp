#include <vigil/vision/detection_decoder.hpp>
#include <cstddef>

namespace vigil::vision {

DetectionDecoder::DetectionDecoder(float confidence_threshold, BoxLayout layout,
                                   ScoreCutoff cutoff)
    : confidence_threshold_(confidence_threshold), layout_(layout), cutoff_(cutoff) {}

std::vector<Detection> DetectionDecoder::decode(const Detections& result) const {
  std::vector<Detection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);

  for (std::size_t i = 0; i < n; ++i) {
    const float score = i < result.scores.size() ? result.scores[i] : 0.f;
    if (score < confidence_threshold_ ||
        (cutoff_ == ScoreCutoff::Strict && score == confidence_threshold_)) {
      continue;
    }
    if (i * 4 + 3 >= result.boxes.size()) {
      continue;
    }

    Detection d;
    d.score = score;
    if (i < result.class_ids.size()) {
      d.class_id = result.class_ids[i];
    }
    const float* b = result.boxes.data() + i * 4;
    if (layout_ == BoxLayout::XYXY) {
      d.box = {b[0], b[1], b[2], b[3]};
    } else {
      d.box = {b[1], b[0], b[3], b[2]};
    }
    out.push_back(d);
  }
  return out;
}

}  // namespace vigil::vision
