#include <gtest/gtest.h>

#include "errors.hpp"
#include "stream_json.hpp"

using nlohmann::json;

TEST(StreamJsonTest, ConfigSerialization) {
  StreamConfig c = preset_config(PerformanceMode::PERFORMANCE);
  c.id = "stream-abc";
  json j = c;
  EXPECT_EQ(j["id"], "stream-abc");
  EXPECT_EQ(j["fps"], 60);
  EXPECT_EQ(j["quality"], 50);
  EXPECT_EQ(j["format"], "jpeg");
  EXPECT_TRUE(j["region"].is_null());

  c.region = Region{1, 2, 3, 4};
  j = c;
  EXPECT_EQ(j["region"]["width"], 3);
}

TEST(StreamJsonTest, InfoAddsState) {
  StreamInfo i;
  i.config.id = "stream-x";
  i.state = StreamState::Running;
  i.degraded = true;
  json j = i;
  EXPECT_EQ(j["state"], "running");
  EXPECT_EQ(j["degraded"], true);
  EXPECT_EQ(j["id"], "stream-x");
}

TEST(StreamJsonTest, NoticeCarriesUriAndTimestamp) {
  FrameNotice n;
  n.stream_id = "stream-x";
  n.uri = "screen://capture/0000000000000001";
  n.mime_type = "image/png";
  n.format = ImageFormat::PNG;
  n.sequence = 3;
  n.timestamp = WallTime(std::chrono::milliseconds(1700000000123));
  json j = n;
  EXPECT_EQ(j["uri"], n.uri);
  EXPECT_EQ(j["format"], "png");
  EXPECT_EQ(j["sequence"], 3);
  EXPECT_EQ(j["timestamp_ms"], 1700000000123LL);
}

TEST(StreamJsonTest, RequestUsesDefaultMode) {
  StreamConfig c = parse_stream_request(json::object(), PerformanceMode::BALANCED);
  EXPECT_EQ(c.target_fps, 30);
  EXPECT_EQ(c.quality, 75);
}

TEST(StreamJsonTest, RequestOverridesPreset) {
  json body = {{"mode", "extreme"},
               {"quality", 40},
               {"format", "png"},
               {"frame_skip", false},
               {"region", {{"x", 0}, {"y", 0}, {"width", 100}, {"height", 50}}}};
  StreamConfig c = parse_stream_request(body, PerformanceMode::BALANCED);
  EXPECT_EQ(c.target_fps, 120);
  EXPECT_EQ(c.min_quality, 20);
  EXPECT_EQ(c.quality, 40);
  EXPECT_EQ(c.format, ImageFormat::PNG);
  EXPECT_FALSE(c.frame_skip);
  ASSERT_TRUE(c.region.has_value());
  EXPECT_EQ(c.region->height, 50);
}

TEST(StreamJsonTest, MalformedRequestIsInvalidConfig) {
  auto code_of = [](const json& body) {
    try {
      parse_stream_request(body, PerformanceMode::BALANCED);
    } catch (const StreamError& e) {
      return e.code();
    }
    return ErrorCode::InvalidState;
  };
  EXPECT_EQ(code_of(json::array()), ErrorCode::InvalidConfig);
  EXPECT_EQ(code_of(json{{"fps", "fast"}}), ErrorCode::InvalidConfig);
  EXPECT_EQ(code_of(json{{"mode", "turbo"}}), ErrorCode::InvalidConfig);
  EXPECT_EQ(code_of(json{{"region", {{"x", 0}}}}), ErrorCode::InvalidConfig);
}
