#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "capture.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "load_source.hpp"
#include "time_source.hpp"

// Clock that only moves when a test advances it.
class ManualTimeSource : public TimeSource {
public:
  TimePoint now() const override {
    return TimePoint(Clock::duration(ticks_.load()));
  }
  void advance(Clock::duration d) { ticks_.fetch_add(d.count()); }

private:
  std::atomic<Clock::rep> ticks_{Clock::duration(std::chrono::hours(1)).count()};
};

// Returns a tiny frame. An optional hook runs before each capture and may throw or
// advance a manual clock.
class FakeFrameSource : public FrameSource {
public:
  RawFrame capture(const std::optional<Region>&, int) override {
    const int n = calls.fetch_add(1) + 1;
    if (hook) hook(n);
    RawFrame f;
    f.width = 4;
    f.height = 2;
    f.channels = 3;
    f.pixels.assign(4 * 2 * 3, static_cast<uint8_t>(n));
    f.timestamp = WallClock::now();
    return f;
  }

  std::atomic<int> calls{0};
  std::function<void(int)> hook;
};

class FakeEncoder : public Encoder {
public:
  std::vector<uint8_t> encode(const RawFrame& frame, ImageFormat, int quality) override {
    last_quality = quality;
    ++calls;
    std::vector<uint8_t> out{0xFF, 0xD8};
    out.push_back(static_cast<uint8_t>(quality));
    out.push_back(frame.pixels.empty() ? 0 : frame.pixels[0]);
    return out;
  }

  std::atomic<int> last_quality{0};
  std::atomic<int> calls{0};
};

// Blocks every capture until released.
class BlockingFrameSource : public FrameSource {
public:
  RawFrame capture(const std::optional<Region>&, int) override {
    entered.store(true);
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return released_; });
    throw StreamError(ErrorCode::CaptureFailure, "released");
  }

  void release() {
    {
      std::lock_guard<std::mutex> g(mu_);
      released_ = true;
    }
    cv_.notify_all();
  }

  std::atomic<bool> entered{false};

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool released_{false};
};

class FixedLoadSource : public LoadSource {
public:
  explicit FixedLoadSource(double p) : percent(p) {}
  std::optional<double> sample() override {
    ++samples;
    return percent.load();
  }

  std::atomic<double> percent;
  std::atomic<int> samples{0};
};
