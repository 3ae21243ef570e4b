#pragma once
#include <nlohmann/json.hpp>

#include "metrics.hpp"
#include "resource_cache.hpp"
#include "stream_config.hpp"
#include "stream_registry.hpp"

void to_json(nlohmann::json& j, const Region& r);
void to_json(nlohmann::json& j, const StreamConfig& c);
void to_json(nlohmann::json& j, const StreamInfo& i);
void to_json(nlohmann::json& j, const MetricsSnapshot& s);
void to_json(nlohmann::json& j, const FrameNotice& n);
void to_json(nlohmann::json& j, const CacheStats& s);

// Builds a stream request from a JSON body. An optional "mode" picks the preset the other
// fields override; without it `default_mode` is used. Throws StreamError(InvalidConfig).
StreamConfig parse_stream_request(const nlohmann::json& j, PerformanceMode default_mode);
