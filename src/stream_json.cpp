#include "stream_json.hpp"

#include "errors.hpp"

using nlohmann::json;

void to_json(json& j, const Region& r) {
  j = json{{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

void to_json(json& j, const StreamConfig& c) {
  j = json{{"id", c.id},
           {"fps", c.target_fps},
           {"format", to_string(c.format)},
           {"quality", c.quality},
           {"min_quality", c.min_quality},
           {"max_quality", c.max_quality},
           {"monitor", c.monitor},
           {"frame_skip", c.frame_skip},
           {"adaptive_quality", c.adaptive_quality}};
  j["region"] = c.region ? json(*c.region) : json(nullptr);
}

void to_json(json& j, const StreamInfo& i) {
  j = json(i.config);
  j["state"] = to_string(i.state);
  j["degraded"] = i.degraded;
}

void to_json(json& j, const MetricsSnapshot& s) {
  auto stats = [](const DurationStats& d) {
    return json{{"mean", d.mean}, {"min", d.min}, {"max", d.max}};
  };
  j = json{{"current_fps", s.current_fps},
           {"session_fps", s.session_fps},
           {"capture_ms", stats(s.capture_ms)},
           {"encode_ms", stats(s.encode_ms)},
           {"total_ms", stats(s.total_ms)},
           {"total_p50_ms", s.total_p50},
           {"total_p95_ms", s.total_p95},
           {"total_p99_ms", s.total_p99},
           {"frame_count", s.frame_count},
           {"frames_total", s.frames_total},
           {"skipped_frames", s.skipped_frames},
           {"failed_frames", s.failed_frames},
           {"skip_rate", s.skip_rate}};
}

void to_json(json& j, const FrameNotice& n) {
  j = json{{"stream_id", n.stream_id},
           {"uri", n.uri},
           {"mime_type", n.mime_type},
           {"format", to_string(n.format)},
           {"width", n.width},
           {"height", n.height},
           {"quality", n.quality},
           {"sequence", n.sequence},
           {"timestamp_ms", to_unix_ms(n.timestamp)}};
}

void to_json(json& j, const CacheStats& s) {
  j = json{{"entries", s.entries}, {"capacity", s.capacity}, {"puts", s.puts},
           {"hits", s.hits},       {"misses", s.misses},     {"evictions", s.evictions}};
}

StreamConfig parse_stream_request(const json& j, PerformanceMode default_mode) {
  if (!j.is_object()) throw StreamError(ErrorCode::InvalidConfig, "stream request must be an object");
  try {
    PerformanceMode mode = default_mode;
    if (j.contains("mode")) mode = parse_performance_mode(j.at("mode").get<std::string>());
    StreamConfig c = preset_config(mode);

    if (j.contains("fps")) c.target_fps = j.at("fps").get<int>();
    if (j.contains("format")) c.format = parse_image_format(j.at("format").get<std::string>());
    if (j.contains("quality")) c.quality = j.at("quality").get<int>();
    if (j.contains("min_quality")) c.min_quality = j.at("min_quality").get<int>();
    if (j.contains("max_quality")) c.max_quality = j.at("max_quality").get<int>();
    if (j.contains("monitor")) c.monitor = j.at("monitor").get<int>();
    if (j.contains("frame_skip")) c.frame_skip = j.at("frame_skip").get<bool>();
    if (j.contains("adaptive_quality")) c.adaptive_quality = j.at("adaptive_quality").get<bool>();
    if (j.contains("region") && !j.at("region").is_null()) {
      const auto& r = j.at("region");
      c.region = Region{r.at("x").get<int>(), r.at("y").get<int>(), r.at("width").get<int>(),
                        r.at("height").get<int>()};
    }
    return c;
  } catch (const json::exception& e) {
    throw StreamError(ErrorCode::InvalidConfig, std::string("malformed stream request: ") + e.what());
  }
}
