#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

double percentile_sorted(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const auto n = static_cast<double>(sorted.size());
  long idx = static_cast<long>(std::ceil(p * n)) - 1;
  idx = std::clamp(idx, 0L, static_cast<long>(sorted.size()) - 1);
  return sorted[static_cast<size_t>(idx)];
}

namespace {

template <typename Field>
DurationStats summarize(const std::deque<FrameMetricSample>& w, Field f) {
  DurationStats d{};
  if (w.empty()) return d;
  d.min = f(w.front());
  d.max = d.min;
  double sum = 0;
  for (const auto& s : w) {
    const double v = f(s);
    sum += v;
    d.min = std::min(d.min, v);
    d.max = std::max(d.max, v);
  }
  d.mean = sum / static_cast<double>(w.size());
  return d;
}

}  // namespace

MetricsCollector::MetricsCollector(size_t capacity, size_t rate_window)
    : cap_(std::max<size_t>(1, capacity)), rate_window_(std::max<size_t>(1, rate_window)) {}

void MetricsCollector::record(const FrameMetricSample& sample) {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (window_.size() == cap_) window_.pop_front();
    window_.push_back(sample);
    if (!first_record_) first_record_ = Clock::now();
  }
  frames_total_.fetch_add(1, std::memory_order_relaxed);
}

size_t MetricsCollector::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return window_.size();
}

MetricsSnapshot MetricsCollector::snapshot() const {
  MetricsSnapshot s{};
  std::vector<double> totals;
  std::optional<TimePoint> first;
  {
    std::lock_guard<std::mutex> g(mu_);
    s.frame_count = window_.size();
    s.capture_ms = summarize(window_, [](const FrameMetricSample& x) { return x.capture_ms; });
    s.encode_ms = summarize(window_, [](const FrameMetricSample& x) { return x.encode_ms; });
    s.total_ms = summarize(window_, [](const FrameMetricSample& x) { return x.total_ms; });

    const size_t recent = std::min(rate_window_, window_.size());
    if (recent > 0) {
      double sum = 0;
      for (size_t i = window_.size() - recent; i < window_.size(); ++i) sum += window_[i].total_ms;
      const double mean = sum / static_cast<double>(recent);
      s.current_fps = mean > 0 ? 1000.0 / mean : 0.0;
    }

    totals.reserve(window_.size());
    for (const auto& x : window_) totals.push_back(x.total_ms);
    first = first_record_;
  }

  std::sort(totals.begin(), totals.end());
  s.total_p50 = percentile_sorted(totals, 0.50);
  s.total_p95 = percentile_sorted(totals, 0.95);
  s.total_p99 = percentile_sorted(totals, 0.99);

  s.frames_total = frames_total_.load(std::memory_order_relaxed);
  s.skipped_frames = skipped_total_.load(std::memory_order_relaxed);
  s.failed_frames = failed_total_.load(std::memory_order_relaxed);
  const auto attempts = s.frames_total + s.skipped_frames;
  s.skip_rate = attempts ? static_cast<double>(s.skipped_frames) / static_cast<double>(attempts)
                         : 0.0;

  if (first) {
    const double secs = std::chrono::duration<double>(Clock::now() - *first).count();
    s.session_fps = secs > 0 ? static_cast<double>(s.frames_total) / secs : 0.0;
  }
  return s;
}

std::string prometheus_text(const std::string& stream_id, const MetricsSnapshot& s) {
  std::ostringstream os;
  const std::string lbl = "stream=\"" + stream_id + "\"";
  os << "framerelay_frame_total_ms{" << lbl << ",quantile=\"0.5\"} " << s.total_p50 << "\n";
  os << "framerelay_frame_total_ms{" << lbl << ",quantile=\"0.95\"} " << s.total_p95 << "\n";
  os << "framerelay_frame_total_ms{" << lbl << ",quantile=\"0.99\"} " << s.total_p99 << "\n";
  os << "framerelay_capture_ms_mean{" << lbl << "} " << s.capture_ms.mean << "\n";
  os << "framerelay_encode_ms_mean{" << lbl << "} " << s.encode_ms.mean << "\n";
  os << "framerelay_frames_total{" << lbl << "} " << s.frames_total << "\n";
  os << "framerelay_frames_skipped_total{" << lbl << "} " << s.skipped_frames << "\n";
  os << "framerelay_frames_failed_total{" << lbl << "} " << s.failed_frames << "\n";
  os << "framerelay_skip_rate{" << lbl << "} " << s.skip_rate << "\n";
  os << "framerelay_current_fps{" << lbl << "} " << s.current_fps << "\n";
  return os.str();
}
