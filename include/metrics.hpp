#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Exact-rank percentile of an ascending-sorted vector, p in [0,1].
// Index is ceil(p * n) - 1 clamped to [0, n-1]; empty input yields 0.
double percentile_sorted(const std::vector<double>& sorted, double p);

struct DurationStats {
  double mean{0}, min{0}, max{0};
};

struct MetricsSnapshot {
  double current_fps{0};
  double session_fps{0};

  DurationStats capture_ms;
  DurationStats encode_ms;
  DurationStats total_ms;
  double total_p50{0}, total_p95{0}, total_p99{0};

  uint64_t frame_count{0};   // samples currently in the window
  uint64_t frames_total{0};  // lifetime produced frames
  uint64_t skipped_frames{0};
  uint64_t failed_frames{0};
  double skip_rate{0};
};

class MetricsCollector {
public:
  explicit MetricsCollector(size_t capacity = 100, size_t rate_window = 10);

  void record(const FrameMetricSample& sample);
  void record_skip() { skipped_total_.fetch_add(1, std::memory_order_relaxed); }
  // A failed frame also counts as skipped.
  void record_failure() {
    failed_total_.fetch_add(1, std::memory_order_relaxed);
    skipped_total_.fetch_add(1, std::memory_order_relaxed);
  }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t skipped_total() const { return skipped_total_.load(std::memory_order_relaxed); }
  uint64_t failed_total() const { return failed_total_.load(std::memory_order_relaxed); }
  size_t capacity() const { return cap_; }
  size_t size() const;

  MetricsSnapshot snapshot() const;

private:
  size_t cap_;
  size_t rate_window_;
  mutable std::mutex mu_;
  std::deque<FrameMetricSample> window_;
  std::optional<TimePoint> first_record_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> skipped_total_{0};
  std::atomic<uint64_t> failed_total_{0};
};

std::string prometheus_text(const std::string& stream_id, const MetricsSnapshot& s);
