#pragma once

#include <vigil/core/analysis_result.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vigil::app {

/// Callback for each AnalysisResult; may be invoked from worker threads.
/// Must be thread-safe if using run_analysis_batch_parallel.
using AnalysisResultCallback = std::function<void(const vigil::core::AnalysisResult&)>;

/// Callback for each AttentionReport; same threading rules as AnalysisResultCallback.
using AttentionReportCallback = std::function<void(const vigil::core::AttentionReport&)>;

/// Optional per-step timing: (step, duration_ms).
using StepTimingCallback = vigil::core::StepTimingCallback;

/// Analyzes a single frame. No threading; direct call.
/// The result carries frame_id and, if provided, session_id for traceability.
[[nodiscard]] std::expected<vigil::core::AnalysisResult, vigil::core::AnalysisError>
run_analysis(const vigil::core::FrameAnalysisPipeline& pipeline,
             const vigil::core::Frame& frame,
             std::uint64_t frame_id = 0,
             std::optional<std::string> session_id = std::nullopt,
             StepTimingCallback* timing_cb = nullptr);

/// Attention check on a single frame; tagging as for run_analysis().
[[nodiscard]] std::expected<vigil::core::AttentionReport, vigil::core::AnalysisError>
run_attention(const vigil::core::FrameAnalysisPipeline& pipeline,
              const vigil::core::Frame& frame,
              std::uint64_t frame_id = 0,
              std::optional<std::string> session_id = std::nullopt,
              StepTimingCallback* timing_cb = nullptr);

/// Analyzes frames sequentially; calls callback for each successful result.
/// frame_id is the frame's index in \p frames. If session_ids is provided (same size
/// as frames), each result is tagged with the corresponding id; empty string = leave unset.
/// Failed frames are logged and skipped.
void run_analysis_batch(const vigil::core::FrameAnalysisPipeline& pipeline,
                        const std::vector<vigil::core::Frame>& frames,
                        AnalysisResultCallback callback,
                        const std::vector<std::string>* session_ids = nullptr);

/// Analyzes frames in parallel using a thread pool over the shared pipeline.
/// Callback may be invoked from any worker (must be thread-safe); result order is
/// not preserved, use frame_id. num_workers 0 = use hardware concurrency.
void run_analysis_batch_parallel(const vigil::core::FrameAnalysisPipeline& pipeline,
                                 const std::vector<vigil::core::Frame>& frames,
                                 AnalysisResultCallback callback,
                                 std::size_t num_workers = 0,
                                 const std::vector<std::string>* session_ids = nullptr);

/// Attention checks in parallel; same contract as run_analysis_batch_parallel().
void run_attention_batch_parallel(const vigil::core::FrameAnalysisPipeline& pipeline,
                                  const std::vector<vigil::core::Frame>& frames,
                                  AttentionReportCallback callback,
                                  std::size_t num_workers = 0,
                                  const std::vector<std::string>* session_ids = nullptr);

}  // namespace vigil::app
