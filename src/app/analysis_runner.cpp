#include <vigil/app/analysis_runner.hpp>
#include <vigil/app/log.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace vigil::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

template <typename Result>
void tag(Result& result,
         std::uint64_t frame_id,
         const std::vector<std::string>* session_ids,
         std::size_t n) {
  result.frame_id = frame_id;
  if (session_ids && session_ids->size() == n && !(*session_ids)[frame_id].empty()) {
    result.session_id = (*session_ids)[frame_id];
  }
}

/// Runs analyze_one on frames[idx] and hands the tagged result to callback.
/// A failed frame (error or collaborator exception) is logged and skipped.
template <typename Analyze, typename Callback>
void run_one(const Analyze& analyze_one,
             const std::vector<vigil::core::Frame>& frames,
             std::size_t idx,
             const Callback& callback,
             const std::vector<std::string>* session_ids) {
  decltype(analyze_one(frames[idx])) result;
  try {
    result = analyze_one(frames[idx]);
  } catch (const std::exception& e) {
    log::err << "frame " << idx << " skipped: " << e.what() << log::endl;
    return;
  }
  if (!result) {
    log::warn << "frame " << idx << " skipped: " << vigil::core::to_string(result.error())
              << log::endl;
    return;
  }
  tag(*result, static_cast<std::uint64_t>(idx), session_ids, frames.size());
  callback(*result);
}

/// Thread-pool fan-out over frame indices; workers pull from a shared queue.
template <typename Analyze, typename Callback>
void run_parallel(Analyze analyze_one,
                  const std::vector<vigil::core::Frame>& frames,
                  const Callback& callback,
                  std::size_t num_workers,
                  const std::vector<std::string>* session_ids) {
  const std::size_t n = frames.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) {
      run_one(analyze_one, frames, i, callback, session_ids);
    }
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      run_one(analyze_one, frames, idx, callback, session_ids);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace

std::expected<vigil::core::AnalysisResult, vigil::core::AnalysisError>
run_analysis(const vigil::core::FrameAnalysisPipeline& pipeline,
             const vigil::core::Frame& frame,
             std::uint64_t frame_id,
             std::optional<std::string> session_id,
             StepTimingCallback* timing_cb) {
  auto result = pipeline.analyze(frame, timing_cb);
  if (result) {
    result->frame_id = frame_id;
    if (session_id.has_value()) result->session_id = std::move(session_id);
  }
  return result;
}

std::expected<vigil::core::AttentionReport, vigil::core::AnalysisError>
run_attention(const vigil::core::FrameAnalysisPipeline& pipeline,
              const vigil::core::Frame& frame,
              std::uint64_t frame_id,
              std::optional<std::string> session_id,
              StepTimingCallback* timing_cb) {
  auto report = pipeline.check_attention(frame, timing_cb);
  if (report) {
    report->frame_id = frame_id;
    if (session_id.has_value()) report->session_id = std::move(session_id);
  }
  return report;
}

void run_analysis_batch(const vigil::core::FrameAnalysisPipeline& pipeline,
                        const std::vector<vigil::core::Frame>& frames,
                        AnalysisResultCallback callback,
                        const std::vector<std::string>* session_ids) {
  if (!callback) return;
  auto analyze_one = [&pipeline](const vigil::core::Frame& f) { return pipeline.analyze(f); };
  for (std::size_t i = 0; i < frames.size(); ++i) {
    run_one(analyze_one, frames, i, callback, session_ids);
  }
}

void run_analysis_batch_parallel(const vigil::core::FrameAnalysisPipeline& pipeline,
                                 const std::vector<vigil::core::Frame>& frames,
                                 AnalysisResultCallback callback,
                                 std::size_t num_workers,
                                 const std::vector<std::string>* session_ids) {
  run_parallel(
      [&pipeline](const vigil::core::Frame& f) { return pipeline.analyze(f); },
      frames, callback, num_workers, session_ids);
}

void run_attention_batch_parallel(const vigil::core::FrameAnalysisPipeline& pipeline,
                                  const std::vector<vigil::core::Frame>& frames,
                                  AttentionReportCallback callback,
                                  std::size_t num_workers,
                                  const std::vector<std::string>* session_ids) {
  run_parallel(
      [&pipeline](const vigil::core::Frame& f) { return pipeline.check_attention(f); },
      frames, callback, num_workers, session_ids);
}

}  // namespace vigil::app
