#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/frame_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace vigil::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of frame stages (e.g. color convert -> resize -> normalize)
/// ahead of a model. An empty Preprocessor returns a copy of its input.
class Preprocessor {
 public:
  Preprocessor() = default;

  void add_stage(std::unique_ptr<IFrameStage> stage);

  /// Thread-safe: stages are not modified during run().
  [[nodiscard]] std::expected<Frame, AnalysisError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IFrameStage>> stages_;
};

}  // namespace vigil::core
