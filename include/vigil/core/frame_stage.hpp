#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <expected>

namespace vigil::core {

/// Abstract preprocessing stage: one Frame in, one transformed Frame out.
/// process() is const; stages hold configuration only.
class IFrameStage {
 public:
  virtual ~IFrameStage() = default;

  [[nodiscard]] virtual std::expected<Frame, AnalysisError> process(
      const Frame& input) const = 0;
};

}  // namespace vigil::core
