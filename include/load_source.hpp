#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "types.hpp"

// External load hint for the quality controller, in percent.
class LoadSource {
public:
  virtual ~LoadSource() = default;
  // Returns nullopt while the load is unknown.
  virtual std::optional<double> sample() = 0;
};

// System-wide CPU busy share read from /proc/stat, averaged over the time since the
// previous read. Reads at most once per `min_interval`; calls in between get the cached
// value, so many streams can share one instance.
class ProcStatLoadSource : public LoadSource {
public:
  explicit ProcStatLoadSource(std::string path = "/proc/stat",
                              std::chrono::milliseconds min_interval = std::chrono::milliseconds(500));

  std::optional<double> sample() override;

  // Parses the aggregate "cpu" line into busy and total jiffies.
  static bool parse_cpu_line(const std::string& line, uint64_t& busy, uint64_t& total);

private:
  std::string path_;
  Clock::duration min_interval_;
  std::mutex mu_;
  std::optional<TimePoint> last_read_;
  uint64_t last_busy_{0};
  uint64_t last_total_{0};
  bool have_counters_{false};
  std::optional<double> last_value_;
};
