#include "load_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

ProcStatLoadSource::ProcStatLoadSource(std::string path, std::chrono::milliseconds min_interval)
    : path_(std::move(path)), min_interval_(min_interval) {}

bool ProcStatLoadSource::parse_cpu_line(const std::string& line, uint64_t& busy, uint64_t& total) {
  std::istringstream in(line);
  std::string label;
  in >> label;
  if (label != "cpu") return false;

  // user nice system idle iowait irq softirq steal; guest time is already in user.
  uint64_t v[8] = {};
  int n = 0;
  while (n < 8 && in >> v[n]) ++n;
  if (n < 4) return false;

  total = 0;
  for (int i = 0; i < n; ++i) total += v[i];
  const uint64_t idle = v[3] + (n > 4 ? v[4] : 0);
  busy = total - idle;
  return true;
}

std::optional<double> ProcStatLoadSource::sample() {
  std::lock_guard<std::mutex> g(mu_);
  const TimePoint now = Clock::now();
  if (last_read_ && now - *last_read_ < min_interval_) return last_value_;
  last_read_ = now;

  std::ifstream file(path_);
  std::string line;
  uint64_t busy = 0, total = 0;
  if (!file || !std::getline(file, line) || !parse_cpu_line(line, busy, total)) {
    spdlog::debug("cpu load unavailable from {}", path_);
    last_value_.reset();
    have_counters_ = false;
    return std::nullopt;
  }

  if (have_counters_ && total > last_total_ && busy >= last_busy_) {
    const double pct = 100.0 * static_cast<double>(busy - last_busy_) /
                       static_cast<double>(total - last_total_);
    last_value_ = std::clamp(pct, 0.0, 100.0);
  }
  last_busy_ = busy;
  last_total_ = total;
  have_counters_ = true;
  return last_value_;
}
