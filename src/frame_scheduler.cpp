#include "frame_scheduler.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace std::chrono;

namespace {

// Upper bound on capture/encode calls still running after their caller gave up.
constexpr size_t kMaxPendingCalls = 4;

}  // namespace

const char* to_string(TickOutcome o) {
  switch (o) {
    case TickOutcome::PRODUCED: return "produced";
    case TickOutcome::SKIPPED: return "skipped";
    case TickOutcome::FAILED: return "failed";
    case TickOutcome::CANCELLED: return "cancelled";
  }
  return "unknown";
}

FrameScheduler::FrameScheduler(StreamConfig cfg, SchedulerOptions opts, ResourceCache& cache,
                               std::shared_ptr<FrameSource> source,
                               std::shared_ptr<Encoder> encoder, std::shared_ptr<TimeSource> time,
                               std::shared_ptr<CallReaper> reaper)
    : cfg_(std::move(cfg)),
      opts_(opts),
      cache_(cache),
      source_(std::move(source)),
      encoder_(std::move(encoder)),
      time_(std::move(time)),
      period_(duration_cast<Clock::duration>(duration<double>(1.0 / std::max(1, cfg_.target_fps)))),
      control_interval_(static_cast<uint64_t>(
          opts.control_interval_ticks > 0 ? opts.control_interval_ticks
                                          : std::max(1, cfg_.target_fps))),
      metrics_(opts.metrics_window),
      controller_(QualityState{cfg_.quality, cfg_.min_quality, cfg_.max_quality, cfg_.target_fps},
                  opts.quality_policy),
      current_quality_(cfg_.quality),
      wake_(std::make_shared<WakeState>()),
      reaper_(reaper ? std::move(reaper) : std::make_shared<CallReaper>()) {
  if (!source_ || !encoder_ || !time_) {
    throw StreamError(ErrorCode::InvalidConfig, "scheduler needs a frame source, encoder and clock");
  }
}

FrameScheduler::~FrameScheduler() { stop(); }

void FrameScheduler::start() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  const StreamState s = state_.load();
  if (s != StreamState::Idle) {
    throw StreamError(ErrorCode::InvalidState,
                      fmt::format("stream {} is {}, cannot start", cfg_.id, to_string(s)));
  }
  state_ = StreamState::Running;
  loop_thread_ = std::thread([this] { loop(); });
  spdlog::info("[{}] started: {} fps, {} q{}, skip={}, adaptive={}", cfg_.id, cfg_.target_fps,
               to_string(cfg_.format), cfg_.quality, cfg_.frame_skip, cfg_.adaptive_quality);
}

void FrameScheduler::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (state_.load() == StreamState::Stopped) return;

  const bool was_running = state_.load() == StreamState::Running;
  {
    std::lock_guard<std::mutex> g(wake_->mu);
    wake_->stop_requested = true;
    state_ = StreamState::Stopping;
  }
  wake_->cv.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();

  close_sinks();
  state_ = StreamState::Stopped;
  if (was_running) {
    spdlog::info("[{}] stopped after {} ticks ({} frames, {} skipped)", cfg_.id, tick_count_.load(),
                 metrics_.frames_total(), metrics_.skipped_total());
  }
}

StreamConfig FrameScheduler::config() const {
  StreamConfig c = cfg_;
  c.quality = current_quality_.load();
  return c;
}

int FrameScheduler::set_quality(int quality) {
  const int q = std::clamp(quality, cfg_.min_quality, cfg_.max_quality);
  pending_quality_.store(q);
  return q;
}

void FrameScheduler::add_sink(std::shared_ptr<FrameSink> sink) {
  if (!sink) return;
  {
    std::lock_guard<std::mutex> g(sinks_mu_);
    if (!sinks_closed_) {
      prune_closed_sinks();
      sinks_.push_back(std::move(sink));
      return;
    }
  }
  sink->close();
}

size_t FrameScheduler::sink_count() const {
  std::lock_guard<std::mutex> g(sinks_mu_);
  return sinks_.size();
}

void FrameScheduler::prune_closed_sinks() {
  sinks_.erase(std::remove_if(sinks_.begin(), sinks_.end(),
                              [](const std::shared_ptr<FrameSink>& s) { return s->closed(); }),
               sinks_.end());
}

void FrameScheduler::notify_sinks(const FrameNotice& n) {
  std::vector<std::shared_ptr<FrameSink>> targets;
  {
    std::lock_guard<std::mutex> g(sinks_mu_);
    prune_closed_sinks();
    targets = sinks_;
  }
  for (auto& s : targets) {
    try {
      s->on_frame(n);
    } catch (const std::exception& e) {
      spdlog::error("[{}] subscriber failed on {}: {}", cfg_.id, n.uri, e.what());
    }
  }
}

void FrameScheduler::close_sinks() {
  std::vector<std::shared_ptr<FrameSink>> targets;
  {
    std::lock_guard<std::mutex> g(sinks_mu_);
    sinks_closed_ = true;
    targets.swap(sinks_);
  }
  for (auto& s : targets) s->close();
}

template <typename Fn>
auto FrameScheduler::bounded_call(Fn fn, ErrorCode failure, const char* what) -> decltype(fn()) {
  using R = decltype(fn());
  auto guarded = [fn = std::move(fn), failure]() -> R {
    try {
      return fn();
    } catch (const StreamError&) {
      throw;
    } catch (const std::exception& e) {
      throw StreamError(failure, e.what());
    }
  };
  if (opts_.call_timeout_ms <= 0) return guarded();

  abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                  [](const std::shared_ptr<const CallState>& c) {
                                    return c->done.load();
                                  }),
                   abandoned_.end());
  if (abandoned_.size() >= kMaxPendingCalls) {
    throw StreamError(failure, fmt::format("{} backend still busy with {} abandoned calls", what,
                                           abandoned_.size()));
  }

  // The worker holds only shared state, so it may outlive this scheduler.
  auto slot = std::make_shared<CallSlot<R>>();
  std::thread worker([wake = wake_, slot, guarded = std::move(guarded)]() mutable {
    try {
      slot->value.emplace(guarded());
    } catch (...) {
      slot->error = std::current_exception();
    }
    {
      std::lock_guard<std::mutex> g(wake->mu);
      slot->done = true;
    }
    wake->cv.notify_all();
  });

  std::unique_lock<std::mutex> lk(wake_->mu);
  wake_->cv.wait_for(lk, milliseconds(opts_.call_timeout_ms),
                     [&] { return slot->done.load() || wake_->stop_requested; });
  if (!slot->done.load()) {
    const bool cancelled = wake_->stop_requested;
    lk.unlock();
    abandoned_.push_back(slot);
    reaper_->adopt(std::move(worker), slot);
    if (cancelled) {
      throw StreamError(ErrorCode::Cancelled, fmt::format("{} cancelled by stop", what));
    }
    throw StreamError(failure, fmt::format("{} timed out after {} ms", what, opts_.call_timeout_ms));
  }
  lk.unlock();
  worker.join();
  if (slot->error) std::rethrow_exception(slot->error);
  return std::move(*slot->value);
}

TickOutcome FrameScheduler::run_tick() {
  const TimePoint t0 = time_->now();
  const uint64_t tick = tick_count_.fetch_add(1) + 1;

  const int override_q = pending_quality_.exchange(-1);
  if (override_q >= 0) {
    current_quality_ = controller_.override_quality(override_q);
    spdlog::info("[{}] quality set to {}", cfg_.id, current_quality_.load());
  }

  TickOutcome outcome;
  const Clock::duration previous = last_tick_duration();
  if (cfg_.frame_skip && previous > 2 * period_) {
    metrics_.record_skip();
    spdlog::debug("[{}] skipping tick {}: previous tick took {:.1f} ms", cfg_.id, tick,
                  duration<double, std::milli>(previous).count());
    outcome = TickOutcome::SKIPPED;
  } else {
    outcome = produce_frame(t0);
  }
  last_tick_rep_.store((time_->now() - t0).count());

  // Runs on its own cadence, skipped ticks included.
  if (cfg_.adaptive_quality && outcome != TickOutcome::CANCELLED &&
      tick % control_interval_ == 0) {
    std::optional<double> load;
    if (opts_.load_source) load = opts_.load_source->sample();
    current_quality_ = controller_.control_cycle(metrics_.snapshot(), load);
  }
  return outcome;
}

TickOutcome FrameScheduler::produce_frame(TimePoint t0) {
  const int quality = current_quality_.load();
  try {
    RawFrame raw = bounded_call(
        [src = source_, region = cfg_.region, monitor = cfg_.monitor] {
          return src->capture(region, monitor);
        },
        ErrorCode::CaptureFailure, "capture");
    const TimePoint t_captured = time_->now();

    const int width = raw.width;
    const int height = raw.height;
    const WallTime stamp = raw.timestamp;
    std::vector<uint8_t> bytes = bounded_call(
        [enc = encoder_, frame = std::move(raw), format = cfg_.format, quality] {
          return enc->encode(frame, format, quality);
        },
        ErrorCode::EncodeFailure, "encode");
    const TimePoint t_encoded = time_->now();

    FrameMeta meta;
    meta.stream_id = cfg_.id;
    meta.format = cfg_.format;
    meta.width = width;
    meta.height = height;
    meta.quality = quality;
    meta.timestamp = stamp;
    const std::string mime = mime_type_for(cfg_.format);
    const std::string uri = cache_.put(std::move(bytes), mime, meta);

    FrameNotice notice;
    notice.stream_id = cfg_.id;
    notice.uri = uri;
    notice.mime_type = mime;
    notice.format = cfg_.format;
    notice.width = width;
    notice.height = height;
    notice.quality = quality;
    notice.sequence = ++produced_seq_;
    notice.timestamp = stamp;
    notify_sinks(notice);

    FrameMetricSample sample;
    sample.capture_ms = duration<double, std::milli>(t_captured - t0).count();
    sample.encode_ms = duration<double, std::milli>(t_encoded - t_captured).count();
    sample.total_ms = duration<double, std::milli>(time_->now() - t0).count();
    sample.timestamp = WallClock::now();
    metrics_.record(sample);

    consecutive_failures_ = 0;
    if (degraded_.exchange(false)) {
      spdlog::info("[{}] recovered, leaving degraded mode", cfg_.id);
    }
    return TickOutcome::PRODUCED;
  } catch (const StreamError& e) {
    if (e.code() == ErrorCode::Cancelled) return TickOutcome::CANCELLED;
    note_failure(e);
    return TickOutcome::FAILED;
  }
}

void FrameScheduler::note_failure(const StreamError& e) {
  metrics_.record_failure();
  const int failures = consecutive_failures_.fetch_add(1) + 1;
  spdlog::warn("[{}] frame dropped ({}): {}", cfg_.id, to_string(e.code()), e.what());
  if (failures >= opts_.failure_threshold && !degraded_.exchange(true)) {
    spdlog::warn("[{}] {} consecutive failures, backing off", cfg_.id, failures);
  }
}

Clock::duration FrameScheduler::sleep_after(Clock::duration elapsed) const {
  Clock::duration sleep = std::max(Clock::duration::zero(), period_ - elapsed);
  if (degraded_.load()) {
    const int over = std::min(16, consecutive_failures_.load() - opts_.failure_threshold + 1);
    const auto backoff = period_ * (int64_t{1} << std::max(1, over));
    const auto cap = duration_cast<Clock::duration>(milliseconds(opts_.max_backoff_ms));
    sleep = std::max(sleep, std::min<Clock::duration>(backoff, cap));
  }
  return sleep;
}

void FrameScheduler::loop() {
  while (true) {
    {
      std::lock_guard<std::mutex> g(wake_->mu);
      if (wake_->stop_requested) break;
    }
    const TimePoint t0 = time_->now();
    if (run_tick() == TickOutcome::CANCELLED) break;
    reap_finished_calls();

    const Clock::duration sleep = sleep_after(time_->now() - t0);
    if (sleep > Clock::duration::zero() && wait_for_stop(sleep)) break;
  }
}

bool FrameScheduler::wait_for_stop(Clock::duration d) {
  std::unique_lock<std::mutex> lk(wake_->mu);
  return wake_->cv.wait_for(lk, d, [this] { return wake_->stop_requested; });
}

void FrameScheduler::reap_finished_calls() { reaper_->reap(); }
