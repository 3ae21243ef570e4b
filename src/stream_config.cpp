#include "stream_config.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

#include "errors.hpp"

const char* to_string(PerformanceMode m) {
  switch (m) {
    case PerformanceMode::QUALITY: return "quality";
    case PerformanceMode::BALANCED: return "balanced";
    case PerformanceMode::PERFORMANCE: return "performance";
    case PerformanceMode::EXTREME: return "extreme";
  }
  return "unknown";
}

PerformanceMode parse_performance_mode(const std::string& s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (auto m : all_performance_modes()) {
    if (v == to_string(m)) return m;
  }
  throw StreamError(ErrorCode::InvalidConfig, "unknown performance mode: " + s);
}

std::vector<PerformanceMode> all_performance_modes() {
  return {PerformanceMode::QUALITY, PerformanceMode::BALANCED, PerformanceMode::PERFORMANCE,
          PerformanceMode::EXTREME};
}

StreamConfig preset_config(PerformanceMode m) {
  StreamConfig c;
  switch (m) {
    case PerformanceMode::QUALITY:
      c.target_fps = 10;
      c.quality = 95;
      c.format = ImageFormat::PNG;
      c.frame_skip = false;
      c.adaptive_quality = false;
      break;
    case PerformanceMode::BALANCED:
      c.target_fps = 30;
      c.quality = 75;
      break;
    case PerformanceMode::PERFORMANCE:
      c.target_fps = 60;
      c.quality = 50;
      break;
    case PerformanceMode::EXTREME:
      c.target_fps = 120;
      c.quality = 30;
      c.min_quality = 20;
      break;
  }
  return c;
}

StreamConfig validate_config(const StreamConfig& cfg, const StreamLimits& limits) {
  auto reject = [](const std::string& why) {
    throw StreamError(ErrorCode::InvalidConfig, why);
  };

  if (cfg.target_fps <= 0 || cfg.target_fps > limits.max_fps)
    reject(fmt::format("target_fps {} outside [1, {}]", cfg.target_fps, limits.max_fps));
  if (cfg.quality < 1 || cfg.quality > 100)
    reject(fmt::format("quality {} outside [1, 100]", cfg.quality));
  if (cfg.min_quality < 1 || cfg.max_quality > 100 || cfg.min_quality > cfg.max_quality)
    reject(fmt::format("quality bounds [{}, {}] invalid", cfg.min_quality, cfg.max_quality));
  if (cfg.monitor < 0) reject(fmt::format("monitor index {} is negative", cfg.monitor));

  if (cfg.region) {
    const Region& r = *cfg.region;
    if (r.width <= 0 || r.height <= 0 || r.x < 0 || r.y < 0)
      reject(fmt::format("region {}x{}+{}+{} is empty or negative", r.width, r.height, r.x, r.y));
    // x, y >= 0 here, so the subtraction cannot overflow.
    if (r.width > limits.monitor_width - r.x || r.height > limits.monitor_height - r.y)
      reject(fmt::format("region {}x{}+{}+{} exceeds monitor {}x{}", r.width, r.height, r.x, r.y,
                         limits.monitor_width, limits.monitor_height));
  }

  StreamConfig out = cfg;
  out.quality = std::clamp(cfg.quality, cfg.min_quality, cfg.max_quality);
  return out;
}

int recommended_cache_size(int fps, int buffer_seconds) {
  return std::clamp(fps * buffer_seconds, 30, 600);
}
