#pragma once
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "frame_scheduler.hpp"

struct RegistryConfig {
  StreamLimits limits{};
  SchedulerOptions scheduler{};
  size_t channel_capacity{4};
  size_t max_tombstones{1024};  // stopped ids remembered for idempotent stop
};

struct StreamInfo {
  StreamConfig config;
  StreamState state{StreamState::Idle};
  bool degraded{false};
};

// Owns every stream's scheduler. The cache and the capture/encode backends are supplied
// by the caller and must outlive the registry.
class StreamRegistry {
public:
  StreamRegistry(RegistryConfig cfg, ResourceCache& cache, std::shared_ptr<FrameSource> source,
                 std::shared_ptr<Encoder> encoder);
  ~StreamRegistry();

  StreamRegistry(const StreamRegistry&) = delete;
  StreamRegistry& operator=(const StreamRegistry&) = delete;

  // Throws StreamError: InvalidConfig (bad request), ResourceExhausted (stream limit).
  std::string create(const StreamConfig& cfg);
  // Throws StreamError: NotFound (unknown id), InvalidState (running or already stopped).
  void start(const std::string& id);
  // No-op for streams already stopped; NotFound for ids never created. Only the most
  // recent `max_tombstones` stopped ids are remembered; older ones read as never created.
  // Returns without waiting for a capture/encode call that is stuck in the backend.
  void stop(const std::string& id);
  void stop_all();

  std::vector<StreamConfig> list() const;
  std::vector<StreamInfo> list_info() const;
  std::optional<StreamConfig> get(const std::string& id) const;
  std::optional<StreamInfo> info(const std::string& id) const;
  std::optional<MetricsSnapshot> metrics(const std::string& id) const;

  // Subscriptions; throw StreamError(NotFound) for unknown streams.
  std::shared_ptr<FrameChannel> subscribe(const std::string& id);
  void on_frame(const std::string& id, FrameCallback cb);
  // Returns the quality that will be applied, clamped into the stream's bounds.
  int set_quality(const std::string& id, int quality);

  size_t active_count() const;
  size_t abandoned_calls() const { return reaper_->pending(); }
  const RegistryConfig& config() const { return cfg_; }

private:
  std::shared_ptr<FrameScheduler> find(const std::string& id) const;
  std::string generate_id() const;
  void remember_stopped(const std::string& id);  // mu_ held

  RegistryConfig cfg_;
  ResourceCache& cache_;
  std::shared_ptr<FrameSource> source_;
  std::shared_ptr<Encoder> encoder_;
  // Declared before streams_ so it is destroyed after every scheduler.
  std::shared_ptr<CallReaper> reaper_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<FrameScheduler>> streams_;
  std::set<std::string> stopped_;
  std::deque<std::string> stopped_order_;
};
