#include <vigil/app/analysis_runner_tbb.hpp>

#ifdef VIGIL_HAS_TBB

#include <vigil/app/log.hpp>
#include <vigil/core/error.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <cstdint>

namespace vigil::app {

void run_attention_multi_session_tbb(
    const std::unordered_map<std::string, const vigil::core::FrameAnalysisPipeline*>& pipelines,
    const std::vector<std::pair<std::string, vigil::core::Frame>>& work_items,
    AttentionReportCallbackWithSession callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&pipelines, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& session_id = work_items[i].first;
          const vigil::core::Frame& frame = work_items[i].second;
          auto it = pipelines.find(session_id);
          if (it == pipelines.end() || it->second == nullptr) {
            log::warn << "no pipeline for session " << session_id << ", item " << i
                      << " skipped" << log::endl;
            continue;
          }
          auto report = it->second->check_attention(frame);
          if (!report) {
            log::warn << "session " << session_id << " item " << i
                      << " skipped: " << vigil::core::to_string(report.error()) << log::endl;
            continue;
          }
          report->frame_id = static_cast<std::uint64_t>(i);
          report->session_id = session_id;
          callback(*report, session_id);
        }
      });
}

}  // namespace vigil::app

#endif  // VIGIL_HAS_TBB
