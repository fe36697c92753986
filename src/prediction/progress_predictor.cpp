#include "sme/prediction/progress_predictor.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>

namespace sme::prediction {

namespace {

constexpr double kMaxConfidence = 0.95;
constexpr double kSparseConfidence = 0.3;

double days_between(const core::Timestamp from, const core::Timestamp to) {
  const auto hours = std::chrono::duration_cast<std::chrono::hours>(to - from).count();
  return std::ceil(static_cast<double>(hours) / 24.0);
}

double required_rate(const double remaining, const core::Timestamp from,
                     const core::Timestamp deadline) {
  if (remaining <= 0.0) {
    return 0.0;
  }
  return remaining / std::max(days_between(from, deadline), 1.0);
}

}  // namespace

LinearFit fit_daily_series(const std::vector<double>& values) {
  LinearFit fit;
  const std::size_t n = values.size();
  if (n == 0) {
    return fit;
  }
  if (n == 1) {
    fit.intercept = values.front();
    fit.r_squared = 1.0;
    return fit;
  }

  double sum_x = 0.0;
  double sum_y = 0.0;
  double sum_xy = 0.0;
  double sum_xx = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double x = static_cast<double>(i);
    sum_x += x;
    sum_y += values[i];
    sum_xy += x * values[i];
    sum_xx += x * x;
  }
  const double count = static_cast<double>(n);
  fit.slope = (count * sum_xy - sum_x * sum_y) / (count * sum_xx - sum_x * sum_x);
  fit.intercept = (sum_y - fit.slope * sum_x) / count;

  const double mean = sum_y / count;
  double ss_res = 0.0;
  double ss_tot = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double residual = values[i] - fit.at(static_cast<double>(i));
    ss_res += residual * residual;
    ss_tot += (values[i] - mean) * (values[i] - mean);
  }
  fit.r_squared = ss_tot == 0.0 ? 1.0 : 1.0 - ss_res / ss_tot;
  return fit;
}

ProgressProjection ProgressPredictor::predict(std::vector<ProgressPoint> history,
                                              const ProgressGoal& goal) const {
  std::stable_sort(history.begin(), history.end(),
                   [](const ProgressPoint& a, const ProgressPoint& b) { return a.date < b.date; });

  ProgressProjection projection;
  for (const auto& point : history) {
    projection.completed_hours += point.hours;
  }
  const double remaining = goal.target_hours - projection.completed_hours;

  if (history.size() < 2) {
    const auto reference = history.empty() ? clock_.now() : history.back().date;
    projection.estimated_completion = goal.deadline;
    projection.confidence = kSparseConfidence;
    projection.current_rate = history.empty() ? 0.0 : history.back().hours;
    projection.required_rate = required_rate(remaining, reference, goal.deadline);
    return projection;
  }

  std::vector<double> daily;
  daily.reserve(history.size());
  for (const auto& point : history) {
    daily.push_back(point.hours);
  }
  const LinearFit fit = fit_daily_series(daily);

  double rate = fit.at(static_cast<double>(daily.size()));
  if (!(rate > 0.0)) {
    rate = projection.completed_hours / static_cast<double>(daily.size());
  }

  const auto last = history.back().date;
  projection.current_rate = rate;
  projection.required_rate = required_rate(remaining, last, goal.deadline);
  projection.confidence = std::clamp(fit.r_squared, 0.0, kMaxConfidence);

  if (remaining <= 0.0) {
    projection.estimated_completion = last;
  } else if (rate > 0.0) {
    const double days = std::max(std::ceil(remaining / rate), 1.0);
    projection.estimated_completion =
        last + std::chrono::hours{static_cast<std::int64_t>(days) * 24};
  } else {
    // No hours logged at all: no basis for a projection.
    projection.estimated_completion = goal.deadline;
    projection.confidence = 0.0;
  }
  return projection;
}

}  // namespace sme::prediction
