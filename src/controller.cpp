#include "controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

QualityState next_quality_state(const QualityState& st, const MetricsSnapshot& s,
                                const QualityPolicy& policy, std::optional<double> load_percent) {
  QualityState next = st;
  next.last_direction = QualityDirection::NONE;
  next.last_delta = 0;

  // No samples yet: nothing to react to.
  if (s.frame_count == 0) return next;

  const double target = static_cast<double>(st.target_fps);
  int q = st.quality;
  if (s.current_fps < target * policy.lower_ratio) {
    q = std::max(st.min_quality, st.quality - policy.step);
  } else if (s.current_fps >= target && st.quality < st.max_quality) {
    const bool overloaded = load_percent && *load_percent > policy.load_ceiling;
    if (!overloaded) q = std::min(st.max_quality, st.quality + policy.step);
  }
  q = std::clamp(q, st.min_quality, st.max_quality);

  next.quality = q;
  next.last_delta = q - st.quality;
  if (next.last_delta < 0) next.last_direction = QualityDirection::DOWN;
  if (next.last_delta > 0) next.last_direction = QualityDirection::UP;
  return next;
}

int QualityController::control_cycle(const MetricsSnapshot& s, std::optional<double> load_percent) {
  state_ = next_quality_state(state_, s, policy_, load_percent);
  if (state_.last_delta != 0) {
    spdlog::debug("quality {} -> {} (fps {:.1f}, target {})", state_.quality - state_.last_delta,
                  state_.quality, s.current_fps, state_.target_fps);
  }
  return state_.quality;
}

int QualityController::override_quality(int q) {
  const int prev = state_.quality;
  state_.quality = std::clamp(q, state_.min_quality, state_.max_quality);
  state_.last_delta = state_.quality - prev;
  state_.last_direction = state_.last_delta < 0   ? QualityDirection::DOWN
                          : state_.last_delta > 0 ? QualityDirection::UP
                                                  : QualityDirection::NONE;
  return state_.quality;
}
