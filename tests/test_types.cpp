#include <catch2/catch.hpp>

#include <numbers>

#include "rover_sim/types.hpp"

using namespace rover_sim;

TEST_CASE("Goal names round-trip through the task vocabulary") {
    for (const BehaviorGoal goal : {BehaviorGoal::Random,
                                    BehaviorGoal::Patrol,
                                    BehaviorGoal::FindRocks,
                                    BehaviorGoal::FindWater,
                                    BehaviorGoal::FindGoodWeather,
                                    BehaviorGoal::FindGoodSoil,
                                    BehaviorGoal::FindFlatSurface,
                                    BehaviorGoal::Standby}) {
        REQUIRE(behavior_goal_from_string(to_string(goal)) == goal);
        REQUIRE(is_known_goal(to_string(goal)));
    }
}

TEST_CASE("Unknown task text falls back to random") {
    REQUIRE(behavior_goal_from_string("dig a tunnel") == BehaviorGoal::Random);
    REQUIRE(behavior_goal_from_string("") == BehaviorGoal::Random);
    REQUIRE(behavior_goal_from_string("FindRocks") == BehaviorGoal::Random);
    REQUIRE_FALSE(is_known_goal("dig a tunnel"));
}

TEST_CASE("Angles wrap into the half-open interval (-pi, pi]") {
    constexpr double pi = std::numbers::pi;
    REQUIRE(normalize_angle(pi) == Approx(pi));
    REQUIRE(normalize_angle(-pi) == Approx(pi));
    REQUIRE(normalize_angle(2.0 * pi) == Approx(0.0).margin(1e-12));
    REQUIRE(normalize_angle(1.5 * pi) == Approx(-0.5 * pi));
    REQUIRE(normalize_angle(-1.5 * pi) == Approx(0.5 * pi));
}
