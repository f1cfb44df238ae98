#include <vigil/vision/ssd_face_detector.hpp>
#include <vigil/vision/color_convert_stage.hpp>
#include <vigil/vision/face_box.hpp>
#include <vigil/vision/normalize_stage.hpp>
#include <vigil/vision/resize_stage.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace vigil::vision {

SsdFaceDetector::SsdFaceDetector(std::unique_ptr<IDetectionBackend> backend,
                                 SsdFaceDetectorOptions options)
    : backend_(std::move(backend)),
      decoder_(options.confidence_threshold, options.box_layout, ScoreCutoff::Strict) {
  if (!backend_) {
    throw std::invalid_argument("SsdFaceDetector: backend is required");
  }
  preprocessor_.add_stage(std::make_unique<ColorConvertStage>(vigil::core::PixelFormat::BGR8));
  preprocessor_.add_stage(
      std::make_unique<ResizeStage>(options.input_width, options.input_height));
  preprocessor_.add_stage(std::make_unique<NormalizeStage>(options.channel_mean, 1.f));
}

std::expected<std::optional<vigil::core::FaceBox>, vigil::core::AnalysisError>
SsdFaceDetector::detect(const vigil::core::Frame& image) const {
  auto input = preprocessor_.run(image);
  if (!input) {
    return std::unexpected(input.error());
  }
  auto valid = backend_->validate_input(*input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto raw = backend_->infer(*input);
  if (!raw) {
    return std::unexpected(raw.error());
  }

  std::vector<Detection> faces = decoder_.decode(*raw);
  std::stable_sort(faces.begin(), faces.end(),
                   [](const Detection& a, const Detection& b) { return a.score > b.score; });

  const auto cols = static_cast<float>(image.width());
  const auto rows = static_cast<float>(image.height());
  for (const auto& face : faces) {
    const vigil::core::FaceBox pixel_box{
        static_cast<int>(face.box.x1 * cols), static_cast<int>(face.box.y1 * rows),
        static_cast<int>(face.box.x2 * cols), static_cast<int>(face.box.y2 * rows)};
    if (auto refined = refine_face_box(pixel_box, image.width(), image.height())) {
      return refined;
    }
  }
  return std::optional<vigil::core::FaceBox>{};
}

}  // namespace vigil::vision
