#include <vigil/vision/people_counter.hpp>
#include <vigil/vision/color_convert_stage.hpp>
#include <vigil/vision/normalize_stage.hpp>
#include <vigil/vision/resize_stage.hpp>
#include <stdexcept>

namespace vigil::vision {

PeopleCounter::PeopleCounter(std::unique_ptr<IDetectionBackend> backend,
                             PeopleCounterOptions options)
    : backend_(std::move(backend)),
      options_(options),
      decoder_(options.confidence_threshold, options.box_layout, ScoreCutoff::Strict) {
  if (!backend_) {
    throw std::invalid_argument("PeopleCounter: backend is required");
  }
  preprocessor_.add_stage(std::make_unique<ColorConvertStage>(vigil::core::PixelFormat::RGB8));
  preprocessor_.add_stage(
      std::make_unique<ResizeStage>(options_.input_width, options_.input_height));
  preprocessor_.add_stage(std::make_unique<NormalizeStage>(0.f, 1.f));
}

std::expected<PeopleCount, vigil::core::AnalysisError> PeopleCounter::count(
    const vigil::core::Frame& image) const {
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

  PeopleCount result;
  for (const auto& d : decoder_.decode(*raw)) {
    if (d.class_id == options_.person_class_id) {
      ++result.people;
    }
  }
  return result;
}

}  // namespace vigil::vision
