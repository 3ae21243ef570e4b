#include "call_reaper.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

CallReaper::~CallReaper() {
  std::vector<std::pair<std::thread, std::shared_ptr<const CallState>>> calls;
  {
    std::lock_guard<std::mutex> g(mu_);
    calls.swap(calls_);
  }
  const auto running = std::count_if(calls.begin(), calls.end(),
                                     [](const auto& c) { return !c.second->done.load(); });
  if (running > 0) spdlog::info("waiting for {} abandoned backend call(s)", running);
  for (auto& c : calls) {
    if (c.first.joinable()) c.first.join();
  }
}

void CallReaper::adopt(std::thread worker, std::shared_ptr<const CallState> state) {
  if (!worker.joinable()) return;
  std::lock_guard<std::mutex> g(mu_);
  calls_.emplace_back(std::move(worker), std::move(state));
}

size_t CallReaper::reap() {
  std::vector<std::thread> finished;
  size_t running = 0;
  {
    std::lock_guard<std::mutex> g(mu_);
    for (auto it = calls_.begin(); it != calls_.end();) {
      if (it->second->done.load()) {
        finished.push_back(std::move(it->first));
        it = calls_.erase(it);
      } else {
        ++it;
      }
    }
    running = calls_.size();
  }
  for (auto& t : finished) t.join();
  return running;
}

size_t CallReaper::pending() const {
  std::lock_guard<std::mutex> g(mu_);
  return calls_.size();
}
