#include "frame_sink.hpp"

#include <algorithm>

FrameChannel::FrameChannel(size_t capacity) : cap_(std::max<size_t>(1, capacity)) {}

void FrameChannel::on_frame(const FrameNotice& notice) {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (closed_) return;
    if (q_.size() == cap_) {
      q_.pop_front();
      ++dropped_;
    }
    q_.push_back(notice);
  }
  cv_.notify_one();
}

void FrameChannel::close() {
  {
    std::lock_guard<std::mutex> g(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::optional<FrameNotice> FrameChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, timeout, [this] { return !q_.empty() || closed_; });
  if (q_.empty()) return std::nullopt;
  FrameNotice n = std::move(q_.front());
  q_.pop_front();
  return n;
}

std::optional<FrameNotice> FrameChannel::try_pop() {
  std::lock_guard<std::mutex> g(mu_);
  if (q_.empty()) return std::nullopt;
  FrameNotice n = std::move(q_.front());
  q_.pop_front();
  return n;
}

bool FrameChannel::closed() const {
  std::lock_guard<std::mutex> g(mu_);
  return closed_;
}

size_t FrameChannel::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return q_.size();
}

uint64_t FrameChannel::dropped() const {
  std::lock_guard<std::mutex> g(mu_);
  return dropped_;
}
