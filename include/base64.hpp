#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 base64 with '=' padding.
std::string base64_encode(const uint8_t* data, size_t len);
inline std::string base64_encode(const std::vector<uint8_t>& data) {
  return base64_encode(data.data(), data.size());
}

// Throws std::invalid_argument on characters outside the alphabet or bad padding.
std::vector<uint8_t> base64_decode(const std::string& s);
