#include "sme/prediction/progress_json.h"
#include "sme/prediction/progress_predictor.h"

#include "sme/core/clock.h"
#include "support/fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <utility>
#include <vector>

using namespace sme;
using Catch::Matchers::WithinAbs;

namespace {

core::Timestamp day(const int offset) {
  return testing::monday() + std::chrono::hours{24 * offset};
}

std::vector<prediction::ProgressPoint> series(const std::vector<double>& hours) {
  std::vector<prediction::ProgressPoint> points;
  for (std::size_t i = 0; i < hours.size(); ++i) {
    points.push_back(prediction::ProgressPoint{day(static_cast<int>(i)), hours[i]});
  }
  return points;
}

}  // namespace

TEST_CASE("fit_daily_series is a least-squares line", "[prediction][regression]") {
  const auto fit = prediction::fit_daily_series({2.0, 3.0, 1.5, 4.0, 2.5});
  CHECK_THAT(fit.slope, WithinAbs(0.2, 1e-12));
  CHECK_THAT(fit.intercept, WithinAbs(2.2, 1e-12));
  CHECK_THAT(fit.r_squared, WithinAbs(1.0 - 3.3 / 3.7, 1e-9));
  CHECK_THAT(fit.at(5.0), WithinAbs(3.2, 1e-12));

  SECTION("a constant series fits exactly") {
    const auto flat = prediction::fit_daily_series({2.0, 2.0, 2.0});
    CHECK(flat.slope == 0.0);
    CHECK(flat.r_squared == 1.0);
  }
}

TEST_CASE("ProgressPredictor projects goal completion", "[prediction]") {
  core::ManualClock clock(day(10));
  const prediction::ProgressPredictor predictor(clock);

  SECTION("regular history projects a future date") {
    const auto history = series({2.0, 3.0, 1.5, 4.0, 2.5});
    const auto projection = predictor.predict(history, prediction::ProgressGoal{100.0, day(60)});

    CHECK(projection.estimated_completion > history.back().date);
    CHECK(projection.estimated_completion == day(4) + std::chrono::hours{24 * 28});
    CHECK(projection.confidence >= 0.0);
    CHECK(projection.confidence <= 0.95);
    CHECK_THAT(projection.current_rate, WithinAbs(3.2, 1e-9));
    CHECK_THAT(projection.completed_hours, WithinAbs(13.0, 1e-12));
    CHECK_THAT(projection.required_rate, WithinAbs(87.0 / 56.0, 1e-9));
  }

  SECTION("history order does not matter") {
    auto history = series({2.0, 3.0, 1.5, 4.0, 2.5});
    std::swap(history[0], history[4]);
    const auto projection = predictor.predict(history, prediction::ProgressGoal{100.0, day(60)});
    CHECK(projection.estimated_completion == day(4) + std::chrono::hours{24 * 28});
  }

  SECTION("a perfect fit is capped at 0.95 confidence") {
    const auto projection =
        predictor.predict(series({1.0, 2.0, 3.0}), prediction::ProgressGoal{50.0, day(30)});
    CHECK(projection.confidence == 0.95);
  }

  SECTION("a reached goal completes on the last observed day") {
    const auto projection =
        predictor.predict(series({5.0, 6.0}), prediction::ProgressGoal{10.0, day(30)});
    CHECK(projection.estimated_completion == day(1));
    CHECK(projection.required_rate == 0.0);
  }

  SECTION("sparse history falls back to the deadline") {
    const auto projection =
        predictor.predict(series({3.0}), prediction::ProgressGoal{40.0, day(20)});
    CHECK(projection.estimated_completion == day(20));
    CHECK(projection.confidence == 0.3);

    const auto empty = predictor.predict({}, prediction::ProgressGoal{40.0, day(20)});
    CHECK(empty.estimated_completion == day(20));
    CHECK_THAT(empty.required_rate, WithinAbs(4.0, 1e-12));
  }
}

TEST_CASE("history_from_json decodes study logs", "[prediction][json]") {
  const auto decoded = prediction::history_from_json(nlohmann::json::parse(
      R"([{"date": "2024-01-01", "hours": 2}, {"date": "2024-01-02", "hours": 3.5}])"));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value().size() == 2);
  CHECK(decoded.value()[1].hours == 3.5);
  CHECK(decoded.value()[0].date == testing::monday());

  SECTION("bad dates are an error") {
    const auto bad = prediction::history_from_json(
        nlohmann::json::parse(R"({"history": [{"date": "someday", "hours": 1}]})"));
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error() == "invalid history date: someday");
  }

  SECTION("projection encoding") {
    prediction::ProgressProjection projection;
    projection.estimated_completion = testing::monday();
    projection.confidence = 0.5;
    const auto j = prediction::projection_to_json(projection);
    CHECK(j.at("estimated_completion") == "2024-01-01T00:00:00Z");
    CHECK(j.at("confidence") == 0.5);
  }
}
