#include "util.hpp"

#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["server"]) {
    if (y["server"]["host"]) c.server.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.server.port = y["server"]["port"].as<int>();
  }
  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();

  if (y["limits"]) {
    auto n = y["limits"];
    if (n["max_streams"]) c.registry.limits.max_streams = n["max_streams"].as<int>();
    if (n["max_fps"]) c.registry.limits.max_fps = n["max_fps"].as<int>();
  }
  if (y["cache"]) {
    auto n = y["cache"];
    if (n["max_entries"]) c.cache.max_entries = n["max_entries"].as<size_t>();
    if (n["max_payload_bytes"]) c.cache.max_payload_bytes = n["max_payload_bytes"].as<size_t>();
  }
  if (y["scheduler"]) {
    auto n = y["scheduler"];
    auto& s = c.registry.scheduler;
    if (n["control_interval_ticks"])
      s.control_interval_ticks = n["control_interval_ticks"].as<int>();
    if (n["call_timeout_ms"]) s.call_timeout_ms = n["call_timeout_ms"].as<int>();
    if (n["failure_threshold"]) s.failure_threshold = n["failure_threshold"].as<int>();
    if (n["max_backoff_ms"]) s.max_backoff_ms = n["max_backoff_ms"].as<int>();
    if (n["metrics_window"]) s.metrics_window = n["metrics_window"].as<size_t>();
    if (n["channel_capacity"]) c.registry.channel_capacity = n["channel_capacity"].as<size_t>();
    if (n["max_tombstones"]) c.registry.max_tombstones = n["max_tombstones"].as<size_t>();
  }
  if (y["quality"]) {
    auto n = y["quality"];
    auto& q = c.registry.scheduler.quality_policy;
    if (n["step"]) q.step = n["step"].as<int>();
    if (n["lower_ratio"]) q.lower_ratio = n["lower_ratio"].as<double>();
    if (n["load_ceiling"]) q.load_ceiling = n["load_ceiling"].as<double>();
    if (n["sample_cpu_load"]) c.sample_cpu_load = n["sample_cpu_load"].as<bool>();
  }
  if (y["capture"]) {
    auto n = y["capture"];
    if (n["width"]) c.capture.width = n["width"].as<int>();
    if (n["height"]) c.capture.height = n["height"].as<int>();
    if (n["monitors"]) c.capture.monitors = n["monitors"].as<int>();
  }
  if (y["defaults"] && y["defaults"]["mode"])
    c.default_mode = parse_performance_mode(y["defaults"]["mode"].as<std::string>());

  // Regions are validated against the synthetic monitor.
  c.registry.limits.monitor_width = c.capture.width;
  c.registry.limits.monitor_height = c.capture.height;
  return c;
}
