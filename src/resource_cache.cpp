#include "resource_cache.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "base64.hpp"
#include "errors.hpp"

Encoding parse_encoding(const std::string& s) {
  if (s.empty() || s == "binary") return Encoding::BINARY;
  if (s == "base64") return Encoding::BASE64;
  throw StreamError(ErrorCode::InvalidConfig, "unsupported encoding: " + s);
}

const char* to_string(Encoding e) { return e == Encoding::BASE64 ? "base64" : "binary"; }

ResourceCache::ResourceCache(CacheConfig cfg) : cfg_(cfg) {
  cfg_.max_entries = std::max<size_t>(1, cfg_.max_entries);
}

std::string ResourceCache::put(std::vector<uint8_t> bytes, const std::string& mime_type,
                               const FrameMeta& meta) {
  if (cfg_.max_payload_bytes > 0 && bytes.size() > cfg_.max_payload_bytes) {
    throw StreamError(ErrorCode::ResourceExhausted,
                      fmt::format("frame of {} bytes exceeds cache payload limit {}",
                                  bytes.size(), cfg_.max_payload_bytes));
  }

  auto res = std::make_shared<CachedResource>();
  res->mime_type = mime_type;
  res->bytes = std::move(bytes);
  res->meta = meta;

  // Evicted entries are released after the lock is dropped.
  std::vector<std::shared_ptr<const CachedResource>> evicted;
  std::string uri;
  {
    std::lock_guard<std::mutex> g(mu_);
    res->sequence = next_seq_++;
    res->uri = fmt::format("screen://capture/{:016x}", res->sequence);
    uri = res->uri;
    entries_.emplace(uri, std::move(res));
    order_.push_back(uri);
    ++puts_;

    while (order_.size() > cfg_.max_entries) {
      auto it = entries_.find(order_.front());
      if (it != entries_.end()) {
        evicted.push_back(std::move(it->second));
        entries_.erase(it);
      }
      order_.pop_front();
      ++evictions_;
    }
  }
  return uri;
}

std::shared_ptr<const CachedResource> ResourceCache::get(const std::string& uri) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = entries_.find(uri);
  if (it == entries_.end()) {
    ++misses_;
    spdlog::debug("resource not cached: {}", uri);
    return nullptr;
  }
  ++hits_;
  return it->second;
}

std::optional<EncodedResource> ResourceCache::get_encoded(const std::string& uri,
                                                          Encoding encoding) const {
  auto res = get(uri);
  if (!res) return std::nullopt;

  EncodedResource out;
  out.encoding = encoding;
  out.mime_type = res->mime_type;
  if (encoding == Encoding::BASE64) {
    out.body = base64_encode(res->bytes);
  } else {
    out.body.assign(res->bytes.begin(), res->bytes.end());
  }
  return out;
}

std::vector<std::string> ResourceCache::uris() const {
  std::lock_guard<std::mutex> g(mu_);
  return {order_.begin(), order_.end()};
}

size_t ResourceCache::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return entries_.size();
}

CacheStats ResourceCache::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  CacheStats s;
  s.entries = entries_.size();
  s.capacity = cfg_.max_entries;
  s.puts = puts_;
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  return s;
}
