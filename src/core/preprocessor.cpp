#include <vigil/core/preprocessor.hpp>
#include <chrono>

namespace vigil::core {

void Preprocessor::add_stage(std::unique_ptr<IFrameStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<Frame, AnalysisError> Preprocessor::run(
    const Frame& input,
    StageTimingCallback* timing_cb) const {
  if (input.empty()) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  Frame current = input;
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(current);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }
    current = std::move(*result);
  }
  return current;
}

}  // namespace vigil::core
