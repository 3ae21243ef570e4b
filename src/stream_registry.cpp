#include "stream_registry.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <random>

StreamRegistry::StreamRegistry(RegistryConfig cfg, ResourceCache& cache,
                               std::shared_ptr<FrameSource> source,
                               std::shared_ptr<Encoder> encoder)
    : cfg_(cfg),
      cache_(cache),
      source_(std::move(source)),
      encoder_(std::move(encoder)),
      reaper_(std::make_shared<CallReaper>()) {
  if (!source_ || !encoder_) {
    throw StreamError(ErrorCode::InvalidConfig, "registry needs a frame source and an encoder");
  }
}

StreamRegistry::~StreamRegistry() { stop_all(); }

std::string StreamRegistry::generate_id() const {
  static const std::string chars =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

  std::string id;
  do {
    id = "stream-";
    for (int i = 0; i < 8; ++i) id += chars[dist(gen)];
  } while (streams_.count(id) || stopped_.count(id));
  return id;
}

std::string StreamRegistry::create(const StreamConfig& request) {
  StreamConfig cfg = validate_config(request, cfg_.limits);

  std::lock_guard<std::mutex> g(mu_);
  if (streams_.size() >= static_cast<size_t>(cfg_.limits.max_streams)) {
    throw StreamError(ErrorCode::ResourceExhausted,
                      fmt::format("stream limit reached ({})", cfg_.limits.max_streams));
  }
  cfg.id = generate_id();
  streams_.emplace(cfg.id, std::make_shared<FrameScheduler>(
                               cfg, cfg_.scheduler, cache_, source_, encoder_,
                               std::make_shared<SteadyTimeSource>(), reaper_));
  spdlog::info("created {} ({} fps, {}, q{})", cfg.id, cfg.target_fps, to_string(cfg.format),
               cfg.quality);
  return cfg.id;
}

std::shared_ptr<FrameScheduler> StreamRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = streams_.find(id);
  if (it != streams_.end()) return it->second;
  if (stopped_.count(id)) {
    throw StreamError(ErrorCode::InvalidState,
                      fmt::format("stream {} was stopped; create a new stream", id));
  }
  throw StreamError(ErrorCode::NotFound, fmt::format("no such stream: {}", id));
}

void StreamRegistry::start(const std::string& id) { find(id)->start(); }

void StreamRegistry::stop(const std::string& id) {
  std::shared_ptr<FrameScheduler> sched;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (stopped_.count(id)) return;
    auto it = streams_.find(id);
    if (it == streams_.end()) {
      throw StreamError(ErrorCode::NotFound, fmt::format("no such stream: {}", id));
    }
    sched = std::move(it->second);
    streams_.erase(it);
    remember_stopped(id);
  }
  // Outside the lock so other streams stay reachable while this one winds down.
  sched->stop();
  sched.reset();
  reaper_->reap();
}

void StreamRegistry::remember_stopped(const std::string& id) {
  if (cfg_.max_tombstones == 0) return;
  if (!stopped_.insert(id).second) return;
  stopped_order_.push_back(id);
  while (stopped_order_.size() > cfg_.max_tombstones) {
    stopped_.erase(stopped_order_.front());
    stopped_order_.pop_front();
  }
}

void StreamRegistry::stop_all() {
  std::map<std::string, std::shared_ptr<FrameScheduler>> all;
  {
    std::lock_guard<std::mutex> g(mu_);
    all.swap(streams_);
    for (const auto& kv : all) remember_stopped(kv.first);
  }
  for (auto& kv : all) kv.second->stop();
  if (!all.empty()) spdlog::info("stopped {} stream(s)", all.size());
}

std::vector<StreamConfig> StreamRegistry::list() const {
  std::vector<StreamConfig> out;
  for (auto& i : list_info()) out.push_back(std::move(i.config));
  return out;
}

std::vector<StreamInfo> StreamRegistry::list_info() const {
  std::vector<std::shared_ptr<FrameScheduler>> scheds;
  {
    std::lock_guard<std::mutex> g(mu_);
    for (const auto& kv : streams_) scheds.push_back(kv.second);
  }
  std::vector<StreamInfo> out;
  out.reserve(scheds.size());
  for (const auto& s : scheds) out.push_back({s->config(), s->state(), s->degraded()});
  return out;
}

std::optional<StreamConfig> StreamRegistry::get(const std::string& id) const {
  auto i = info(id);
  if (!i) return std::nullopt;
  return i->config;
}

std::optional<StreamInfo> StreamRegistry::info(const std::string& id) const {
  std::shared_ptr<FrameScheduler> s;
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = streams_.find(id);
    if (it == streams_.end()) return std::nullopt;
    s = it->second;
  }
  return StreamInfo{s->config(), s->state(), s->degraded()};
}

std::optional<MetricsSnapshot> StreamRegistry::metrics(const std::string& id) const {
  std::shared_ptr<FrameScheduler> s;
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = streams_.find(id);
    if (it == streams_.end()) return std::nullopt;
    s = it->second;
  }
  return s->metrics();
}

std::shared_ptr<FrameChannel> StreamRegistry::subscribe(const std::string& id) {
  auto ch = std::make_shared<FrameChannel>(cfg_.channel_capacity);
  find(id)->add_sink(ch);
  return ch;
}

void StreamRegistry::on_frame(const std::string& id, FrameCallback cb) {
  find(id)->add_sink(std::make_shared<CallbackSink>(std::move(cb)));
}

int StreamRegistry::set_quality(const std::string& id, int quality) {
  if (quality < 1 || quality > 100) {
    throw StreamError(ErrorCode::InvalidConfig,
                      fmt::format("quality {} outside [1, 100]", quality));
  }
  return find(id)->set_quality(quality);
}

size_t StreamRegistry::active_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return streams_.size();
}
