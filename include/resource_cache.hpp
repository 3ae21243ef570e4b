#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

struct CachedResource {
  std::string uri;
  std::string mime_type;
  std::vector<uint8_t> bytes;
  FrameMeta meta;
  uint64_t sequence{0};
};

enum class Encoding { BINARY, BASE64 };

Encoding parse_encoding(const std::string& s);  // "binary" | "base64"
const char* to_string(Encoding e);

struct EncodedResource {
  Encoding encoding{Encoding::BINARY};
  std::string mime_type;
  std::string body;  // raw bytes or base64 text
};

struct CacheConfig {
  size_t max_entries{60};
  size_t max_payload_bytes{2 * 1024 * 1024};
};

struct CacheStats {
  size_t entries{0};
  size_t capacity{0};
  uint64_t puts{0};
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t evictions{0};
};

// FIFO frame store shared by every stream. Eviction follows insertion order only.
// Readers hold a shared_ptr, so an evicted entry stays valid for whoever already has it.
class ResourceCache {
public:
  explicit ResourceCache(CacheConfig cfg = CacheConfig{});

  // Throws StreamError(ResourceExhausted) when the payload exceeds max_payload_bytes.
  std::string put(std::vector<uint8_t> bytes, const std::string& mime_type, const FrameMeta& meta);

  std::shared_ptr<const CachedResource> get(const std::string& uri) const;
  std::optional<EncodedResource> get_encoded(const std::string& uri, Encoding encoding) const;

  std::vector<std::string> uris() const;  // oldest first
  size_t size() const;
  size_t capacity() const { return cfg_.max_entries; }
  CacheStats stats() const;

private:
  CacheConfig cfg_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<const CachedResource>> entries_;
  std::deque<std::string> order_;
  uint64_t next_seq_{1};
  uint64_t puts_{0};
  mutable uint64_t hits_{0};
  mutable uint64_t misses_{0};
  uint64_t evictions_{0};
};
