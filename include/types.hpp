#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;
using WallTime = std::chrono::time_point<WallClock>;

enum class ImageFormat { JPEG, PNG };

struct Region {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  bool operator==(const Region& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
  bool operator!=(const Region& o) const { return !(*this == o); }
};

// Uncompressed BGR frame handed from the capture backend to the encoder.
struct RawFrame {
  std::vector<uint8_t> pixels;
  int width{0};
  int height{0};
  int channels{3};
  WallTime timestamp{};
};

struct FrameMetricSample {
  double capture_ms{0};
  double encode_ms{0};
  double total_ms{0};
  WallTime timestamp{};
};

// Metadata stored alongside each cached frame and delivered to subscribers.
struct FrameMeta {
  std::string stream_id;
  ImageFormat format{ImageFormat::JPEG};
  int width{0};
  int height{0};
  int quality{0};
  WallTime timestamp{};
};

struct FrameNotice {
  std::string stream_id;
  std::string uri;
  std::string mime_type;
  ImageFormat format{ImageFormat::JPEG};
  int width{0};
  int height{0};
  int quality{0};
  uint64_t sequence{0};
  WallTime timestamp{};
};

enum class StreamState { Idle, Running, Stopping, Stopped };

const char* to_string(ImageFormat f);
const char* to_string(StreamState s);
const char* mime_type_for(ImageFormat f);
// Accepts "jpeg", "jpg", "png" (case-insensitive). Throws StreamError(InvalidConfig).
ImageFormat parse_image_format(const std::string& s);

inline int64_t to_unix_ms(WallTime t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}
