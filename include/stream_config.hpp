#pragma once
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

struct StreamConfig {
  std::string id;  // assigned by StreamRegistry::create
  int target_fps{30};
  ImageFormat format{ImageFormat::JPEG};
  int quality{75};
  int min_quality{30};
  int max_quality{95};
  std::optional<Region> region;  // empty = full monitor
  int monitor{0};
  bool frame_skip{true};
  bool adaptive_quality{true};

  bool operator==(const StreamConfig& o) const {
    return id == o.id && target_fps == o.target_fps && format == o.format &&
           quality == o.quality && min_quality == o.min_quality &&
           max_quality == o.max_quality && region == o.region && monitor == o.monitor &&
           frame_skip == o.frame_skip && adaptive_quality == o.adaptive_quality;
  }
};

// Deployment-wide bounds applied when a stream is created.
struct StreamLimits {
  int max_fps{120};
  int max_streams{25};
  int monitor_width{1280};
  int monitor_height{720};
};

enum class PerformanceMode { QUALITY, BALANCED, PERFORMANCE, EXTREME };

const char* to_string(PerformanceMode m);
PerformanceMode parse_performance_mode(const std::string& s);
std::vector<PerformanceMode> all_performance_modes();
StreamConfig preset_config(PerformanceMode m);

// Validates fps, quality bounds and region against the limits and returns the config
// with its initial quality clamped into [min_quality, max_quality].
// Throws StreamError(InvalidConfig) on anything out of range.
StreamConfig validate_config(const StreamConfig& cfg, const StreamLimits& limits);

// Frames to keep for `buffer_seconds` of playback at `fps`, within [30, 600].
int recommended_cache_size(int fps, int buffer_seconds = 2);
