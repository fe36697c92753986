#pragma once

#include "sme/core/clock.h"
#include "sme/core/time.h"

#include <vector>

namespace sme::prediction {

struct ProgressPoint {
  core::Timestamp date;
  double hours{0.0};  // hours studied that day
};

struct ProgressGoal {
  double target_hours{0.0};
  core::Timestamp deadline;
};

struct ProgressProjection {
  core::Timestamp estimated_completion;
  double confidence{0.0};     // in [0, 0.95]
  double current_rate{0.0};   // projected hours per day
  double required_rate{0.0};  // hours per day needed to meet the deadline
  double completed_hours{0.0};
};

struct LinearFit {
  double slope{0.0};
  double intercept{0.0};
  double r_squared{0.0};

  [[nodiscard]] double at(const double x) const { return slope * x + intercept; }
};

// Least-squares fit of y over x = 0..n-1. A constant series fits exactly (r² = 1).
[[nodiscard]] LinearFit fit_daily_series(const std::vector<double>& values);

// ProgressPredictor projects when a study-hours goal will be reached.
//
// With fewer than two observations the projection is the deadline itself at
// confidence 0.3. Otherwise the daily series is fitted, the rate is the fitted value
// for the next day (the mean when that is not positive), and completion is the last
// observed date plus ceil(remaining / rate) days.
class ProgressPredictor {
 public:
  explicit ProgressPredictor(const core::IClock& clock) : clock_(clock) {}

  [[nodiscard]] ProgressProjection predict(std::vector<ProgressPoint> history,
                                           const ProgressGoal& goal) const;

 private:
  const core::IClock& clock_;
};

}  // namespace sme::prediction
