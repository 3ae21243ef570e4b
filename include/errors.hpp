#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
  InvalidConfig,
  ResourceExhausted,
  CaptureFailure,
  EncodeFailure,
  NotFound,
  Cancelled,
  InvalidState
};

const char* to_string(ErrorCode c);

class StreamError : public std::runtime_error {
public:
  StreamError(ErrorCode code, const std::string& what)
      : std::runtime_error(what), code_(code) {}
  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};
