#pragma once

#include <vigil/core/analysis_result.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/pipeline.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef VIGIL_HAS_TBB

namespace vigil::app {

/// Callback for each AttentionReport in the multi-session TBB runner; receives the report and session_id.
/// May be invoked from TBB worker threads; must be thread-safe.
using AttentionReportCallbackWithSession =
    std::function<void(const vigil::core::AttentionReport&, const std::string& session_id)>;

/// Runs attention checks over a batch of (session_id, frame) work items in parallel using TBB.
///
/// For each item, the pipeline registered for that session_id checks the frame; on success
/// the report's session_id and frame_id (index in \p work_items) are set and
/// callback(report, session_id) is invoked. Items whose session has no pipeline, and
/// frames that fail, are logged and skipped.
///
/// Pipelines are const and thread-safe, so one pipeline may be registered under many
/// session ids (e.g. one exam room served by shared models) or each session may get its own.
///
/// \param pipelines Map from session_id to pipeline. Caller keeps ownership.
/// \param work_items Flat list of (session_id, frame) pairs. Frames are read only.
/// \param callback Invoked for each successful report. Must be thread-safe.
void run_attention_multi_session_tbb(
    const std::unordered_map<std::string, const vigil::core::FrameAnalysisPipeline*>& pipelines,
    const std::vector<std::pair<std::string, vigil::core::Frame>>& work_items,
    AttentionReportCallbackWithSession callback);

}  // namespace vigil::app

#endif  // VIGIL_HAS_TBB
