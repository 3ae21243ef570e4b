#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

#include "types.hpp"

// Receives one notice per produced frame. Called from the stream's loop thread, so
// implementations must return quickly and must not call back into the registry.
class FrameSink {
public:
  virtual ~FrameSink() = default;
  virtual void on_frame(const FrameNotice& notice) = 0;
  virtual void close() {}
  // Closed sinks are dropped by the producer on its next frame.
  virtual bool closed() const { return false; }
};

using FrameCallback = std::function<void(const FrameNotice&)>;

class CallbackSink : public FrameSink {
public:
  explicit CallbackSink(FrameCallback cb) : cb_(std::move(cb)) {}
  void on_frame(const FrameNotice& notice) override { cb_(notice); }

private:
  FrameCallback cb_;
};

// Bounded queue between a stream loop and one consumer. When full, the oldest notice is
// dropped so a slow consumer never holds up the producer.
class FrameChannel : public FrameSink {
public:
  explicit FrameChannel(size_t capacity = 4);

  void on_frame(const FrameNotice& notice) override;
  void close() override;

  // Waits up to `timeout` for a notice. Returns nullopt on timeout or once closed and drained.
  std::optional<FrameNotice> pop(std::chrono::milliseconds timeout);
  std::optional<FrameNotice> try_pop();

  bool closed() const override;
  size_t size() const;
  uint64_t dropped() const;

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<FrameNotice> q_;
  bool closed_{false};
  uint64_t dropped_{0};
};
