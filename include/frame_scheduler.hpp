#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "call_reaper.hpp"
#include "capture.hpp"
#include "controller.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "frame_sink.hpp"
#include "load_source.hpp"
#include "metrics.hpp"
#include "resource_cache.hpp"
#include "stream_config.hpp"
#include "time_source.hpp"

struct SchedulerOptions {
  int control_interval_ticks{0};  // 0 = once per second (target_fps ticks)
  int call_timeout_ms{2000};      // 0 = run capture/encode inline without a timeout
  int failure_threshold{3};       // consecutive failures before backing off
  int max_backoff_ms{1000};
  size_t metrics_window{100};
  QualityPolicy quality_policy{};
  std::shared_ptr<LoadSource> load_source;  // sampled before each control cycle; may be null
};

enum class TickOutcome { PRODUCED, SKIPPED, FAILED, CANCELLED };

const char* to_string(TickOutcome o);

// Runs the capture -> encode -> publish loop of one stream on its own thread.
//
// Idle -> Running -> Stopping -> Stopped. A stopped scheduler cannot be started again.
//
// Capture/encode calls that overrun their timeout are handed to `reaper`. Without a
// shared reaper the scheduler keeps its own, and destroying it waits for those calls.
class FrameScheduler {
public:
  FrameScheduler(StreamConfig cfg, SchedulerOptions opts, ResourceCache& cache,
                 std::shared_ptr<FrameSource> source, std::shared_ptr<Encoder> encoder,
                 std::shared_ptr<TimeSource> time = std::make_shared<SteadyTimeSource>(),
                 std::shared_ptr<CallReaper> reaper = nullptr);
  ~FrameScheduler();

  FrameScheduler(const FrameScheduler&) = delete;
  FrameScheduler& operator=(const FrameScheduler&) = delete;

  void start();  // throws StreamError(InvalidState) unless Idle
  void stop();   // idempotent; returns once the loop has exited and sinks are closed

  // Executes one tick without the pacing sleep. Used by the loop; callable directly
  // while the scheduler is not running.
  TickOutcome run_tick();

  void add_sink(std::shared_ptr<FrameSink> sink);
  size_t sink_count() const;
  // Clamps into [min_quality, max_quality] and applies it at the start of the next tick.
  // Returns the clamped value.
  int set_quality(int quality);

  StreamState state() const { return state_.load(); }
  bool degraded() const { return degraded_.load(); }
  int consecutive_failures() const { return consecutive_failures_.load(); }
  StreamConfig config() const;
  MetricsSnapshot metrics() const { return metrics_.snapshot(); }
  const std::string& id() const { return cfg_.id; }
  uint64_t ticks() const { return tick_count_.load(); }
  Clock::duration period() const { return period_; }
  Clock::duration last_tick_duration() const { return Clock::duration(last_tick_rep_.load()); }
  // Sleep applied after a tick that took `elapsed`, including degraded backoff.
  Clock::duration sleep_after(Clock::duration elapsed) const;

private:
  struct WakeState {
    std::mutex mu;
    std::condition_variable cv;
    bool stop_requested{false};
  };
  template <typename R>
  struct CallSlot : CallState {
    std::optional<R> value;
    std::exception_ptr error;
  };

  void loop();
  TickOutcome produce_frame(TimePoint t0);
  void note_failure(const StreamError& e);
  template <typename Fn>
  auto bounded_call(Fn fn, ErrorCode failure, const char* what) -> decltype(fn());
  void reap_finished_calls();
  bool wait_for_stop(Clock::duration d);
  void notify_sinks(const FrameNotice& n);
  void prune_closed_sinks();  // sinks_mu_ held
  void close_sinks();

  const StreamConfig cfg_;
  const SchedulerOptions opts_;
  ResourceCache& cache_;
  std::shared_ptr<FrameSource> source_;
  std::shared_ptr<Encoder> encoder_;
  std::shared_ptr<TimeSource> time_;

  const Clock::duration period_;
  const uint64_t control_interval_;

  MetricsCollector metrics_;
  QualityController controller_;
  std::atomic<int> current_quality_;
  std::atomic<int> pending_quality_{-1};

  std::atomic<StreamState> state_{StreamState::Idle};
  std::atomic<bool> degraded_{false};
  std::atomic<int> consecutive_failures_{0};
  std::atomic<uint64_t> tick_count_{0};
  uint64_t produced_seq_{0};
  std::atomic<Clock::rep> last_tick_rep_{0};

  std::mutex lifecycle_mu_;
  // Shared with worker threads so an abandoned call never touches the scheduler.
  std::shared_ptr<WakeState> wake_;
  std::shared_ptr<CallReaper> reaper_;
  // This stream's abandoned calls; touched only by the thread running ticks.
  std::vector<std::shared_ptr<const CallState>> abandoned_;
  std::thread loop_thread_;

  mutable std::mutex sinks_mu_;
  std::vector<std::shared_ptr<FrameSink>> sinks_;
  bool sinks_closed_{false};
};
