#pragma once
#include <optional>

#include "metrics.hpp"

enum class QualityDirection { NONE, DOWN, UP };

struct QualityPolicy {
  int step{5};
  double lower_ratio{0.9};     // below target * lower_ratio -> step down
  double load_ceiling{80.0};   // external load (%) above which no step up happens
};

struct QualityState {
  int quality{75};
  int min_quality{30};
  int max_quality{95};
  int target_fps{30};
  QualityDirection last_direction{QualityDirection::NONE};
  int last_delta{0};
};

// One control step. Pure: same state, snapshot and load always give the same result.
QualityState next_quality_state(const QualityState& st, const MetricsSnapshot& s,
                                const QualityPolicy& policy,
                                std::optional<double> load_percent = std::nullopt);

// Holds the quality state of one stream. Not thread-safe; the owning scheduler loop is the
// only caller of control_cycle/override_quality.
class QualityController {
public:
  QualityController(QualityState initial, QualityPolicy policy)
      : state_(initial), policy_(policy) {}

  int control_cycle(const MetricsSnapshot& s, std::optional<double> load_percent = std::nullopt);
  int override_quality(int q);

  int quality() const { return state_.quality; }
  const QualityState& state() const { return state_; }
  const QualityPolicy& policy() const { return policy_; }

private:
  QualityState state_;
  QualityPolicy policy_;
};
