#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

// Completion flag shared between a bounded call's worker thread and whoever waits on it.
struct CallState {
  std::atomic<bool> done{false};
};

// Takes ownership of capture/encode workers a stream gave up on (timeout or stop) and
// joins them once they return. Shared by every stream of a registry and outliving them,
// so stopping a stream never waits for a hung backend.
class CallReaper {
public:
  CallReaper() = default;
  ~CallReaper();  // joins every adopted worker

  CallReaper(const CallReaper&) = delete;
  CallReaper& operator=(const CallReaper&) = delete;

  void adopt(std::thread worker, std::shared_ptr<const CallState> state);
  // Joins workers that have finished. Returns how many are still running.
  size_t reap();
  size_t pending() const;

private:
  mutable std::mutex mu_;
  std::vector<std::pair<std::thread, std::shared_ptr<const CallState>>> calls_;
};
