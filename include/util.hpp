#pragma once
#include <string>

#include "capture.hpp"
#include "resource_cache.hpp"
#include "stream_registry.hpp"

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8000};
};

struct AppConfig {
  ServerConfig server;
  std::string log_level{"info"};
  RegistryConfig registry;
  CacheConfig cache;
  SyntheticSourceConfig capture;
  PerformanceMode default_mode{PerformanceMode::BALANCED};
  bool sample_cpu_load{true};  // feed /proc/stat CPU load to the quality controllers
};

// Missing keys keep their defaults. Throws YAML::Exception on unreadable or malformed files
// and StreamError(InvalidConfig) on bad enum values.
AppConfig load_config(const std::string& path);
