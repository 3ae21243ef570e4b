#pragma once
#include "types.hpp"

class TimeSource {
public:
  virtual ~TimeSource() = default;
  virtual TimePoint now() const = 0;
};

class SteadyTimeSource : public TimeSource {
public:
  TimePoint now() const override { return Clock::now(); }
};
