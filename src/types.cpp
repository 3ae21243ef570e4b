#include "types.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"

const char* to_string(ImageFormat f) {
  switch (f) {
    case ImageFormat::JPEG: return "jpeg";
    case ImageFormat::PNG: return "png";
  }
  return "unknown";
}

const char* to_string(StreamState s) {
  switch (s) {
    case StreamState::Idle: return "idle";
    case StreamState::Running: return "running";
    case StreamState::Stopping: return "stopping";
    case StreamState::Stopped: return "stopped";
  }
  return "unknown";
}

const char* to_string(ErrorCode c) {
  switch (c) {
    case ErrorCode::InvalidConfig: return "invalid_config";
    case ErrorCode::ResourceExhausted: return "resource_exhausted";
    case ErrorCode::CaptureFailure: return "capture_failure";
    case ErrorCode::EncodeFailure: return "encode_failure";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::InvalidState: return "invalid_state";
  }
  return "unknown";
}

const char* mime_type_for(ImageFormat f) {
  return f == ImageFormat::PNG ? "image/png" : "image/jpeg";
}

ImageFormat parse_image_format(const std::string& s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "jpeg" || v == "jpg") return ImageFormat::JPEG;
  if (v == "png") return ImageFormat::PNG;
  throw StreamError(ErrorCode::InvalidConfig, "unsupported image format: " + s);
}
