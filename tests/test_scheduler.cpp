#include "sme/scheduling/availability_scheduler.h"

#include "support/fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sme;

namespace {

domain::Participant available(const std::string& id, std::vector<domain::TimeSlot> slots) {
  auto p = testing::make_participant(id, {"math"});
  p.availability = std::move(slots);
  return p;
}

std::vector<core::ParticipantId> pids(std::initializer_list<const char*> ids) {
  std::vector<core::ParticipantId> out;
  for (const char* id : ids) {
    out.push_back(core::ParticipantId{id});
  }
  return out;
}

}  // namespace

TEST_CASE("Scheduler finds shared windows", "[scheduling]") {
  const scheduling::AvailabilityScheduler scheduler{};

  SECTION("disjoint windows produce no slot for two participants") {
    const std::vector<domain::Participant> people{available("a", {testing::window(9, 10)}),
                                                  available("b", {testing::window(11, 12)})};
    CHECK(scheduler.find_slots(people, 30, 2).empty());
  }

  SECTION("overlapping windows list everyone present") {
    auto c = available("c", {});
    c.availability = {domain::TimeSlot{"monday", testing::monday() + std::chrono::minutes{630},
                                       testing::monday() + std::chrono::hours{13}, "UTC"}};
    const std::vector<domain::Participant> people{available("a", {testing::window(9, 12)}),
                                                  available("b", {testing::window(10, 11)}), c};

    const auto slots = scheduler.find_slots(people, 60, 2);
    REQUIRE(slots.size() == 3);
    for (const auto& slot : slots) {
      CHECK(slot.participant_ids == pids({"a", "b", "c"}));
    }
    CHECK(slots[0].start == testing::window(9, 12).start);
    CHECK(slots[0].end == testing::window(9, 12).end);
  }

  SECTION("anchors shorter than the duration are skipped") {
    const std::vector<domain::Participant> people{available("a", {testing::window(9, 12)}),
                                                  available("b", {testing::window(10, 11)})};
    const auto slots = scheduler.find_slots(people, 120, 2);
    REQUIRE(slots.size() == 1);
    CHECK(slots[0].start == testing::window(9, 12).start);
  }

  SECTION("larger groups rank first") {
    const std::vector<domain::Participant> people{
        available("a", {testing::window(8, 9), testing::window(14, 16)}),
        available("b", {testing::window(8, 9)}),
        available("c", {testing::window(14, 16)}),
        available("d", {testing::window(15, 17)}),
    };
    const auto slots = scheduler.find_slots(people, 60, 2);
    REQUIRE_FALSE(slots.empty());
    CHECK(slots[0].participant_ids == pids({"a", "c", "d"}));
    CHECK(slots.back().participant_ids == pids({"a", "b"}));
  }

  SECTION("at most five slots are returned") {
    std::vector<domain::Participant> people;
    for (int i = 0; i < 8; ++i) {
      people.push_back(available("p" + std::to_string(i), {testing::window(9, 12)}));
    }
    const auto slots = scheduler.find_slots(people, 60, 2);
    CHECK(slots.size() == scheduling::kMaxScheduleSlots);
    CHECK(slots[0].participant_ids.size() == 8);
  }

  SECTION("participants without availability contribute nothing") {
    const std::vector<domain::Participant> people{available("a", {}),
                                                  available("b", {testing::window(9, 10)})};
    CHECK(scheduler.find_slots(people, 30, 2).empty());
    CHECK(scheduler.find_slots(people, 30, 1).size() == 1);
  }
}

TEST_CASE("Scheduler rejects contract violations", "[scheduling]") {
  const scheduling::AvailabilityScheduler scheduler{};
  const std::vector<domain::Participant> people{available("a", {testing::window(9, 10)})};

  CHECK_THROWS_AS(scheduler.find_slots(people, 0, 2), std::invalid_argument);
  CHECK_THROWS_AS(scheduler.find_slots(people, -15, 2), std::invalid_argument);
  CHECK_THROWS_AS(scheduler.find_slots(people, 30, 0), std::invalid_argument);
}
