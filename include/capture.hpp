#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include "types.hpp"

// Capture backend. Implementations must be safe to call from several stream threads.
// Failures are reported by throwing StreamError(CaptureFailure).
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual RawFrame capture(const std::optional<Region>& region, int monitor) = 0;
};

struct SyntheticSourceConfig {
  int width{1280};
  int height{720};
  int monitors{1};
};

// Renders a moving test pattern with OpenCV in place of a real screen.
class SyntheticFrameSource : public FrameSource {
public:
  explicit SyntheticFrameSource(SyntheticSourceConfig cfg = SyntheticSourceConfig{});
  RawFrame capture(const std::optional<Region>& region, int monitor) override;

  uint64_t frames_rendered() const { return counter_.load(); }

private:
  SyntheticSourceConfig cfg_;
  std::atomic<uint64_t> counter_{0};
};
