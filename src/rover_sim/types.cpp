#include "rover_sim/types.hpp"

#include <array>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace rover_sim {

namespace {

constexpr std::array<std::pair<BehaviorGoal, std::string_view>, 8> k_goal_names{{
    {BehaviorGoal::Random, "random"},
    {BehaviorGoal::Patrol, "patrol"},
    {BehaviorGoal::FindRocks, "findRocks"},
    {BehaviorGoal::FindWater, "findWater"},
    {BehaviorGoal::FindGoodWeather, "findGoodWeather"},
    {BehaviorGoal::FindGoodSoil, "findGoodSoil"},
    {BehaviorGoal::FindFlatSurface, "findFlatSurface"},
    {BehaviorGoal::Standby, "standby"},
}};

}  // namespace

std::string_view to_string(BehaviorGoal goal) {
    for (const auto& [known_goal, name] : k_goal_names) {
        if (known_goal == goal) {
            return name;
        }
    }
    throw std::logic_error("Unhandled BehaviorGoal value");
}

BehaviorGoal behavior_goal_from_string(std::string_view text) noexcept {
    for (const auto& [known_goal, name] : k_goal_names) {
        if (name == text) {
            return known_goal;
        }
    }
    return BehaviorGoal::Random;
}

bool is_known_goal(std::string_view text) noexcept {
    for (const auto& entry : k_goal_names) {
        if (entry.second == text) {
            return true;
        }
    }
    return false;
}

double normalize_angle(double angle_rad) noexcept {
    constexpr double k_two_pi{2.0 * std::numbers::pi};
    double wrapped = std::fmod(angle_rad + std::numbers::pi, k_two_pi);
    if (wrapped <= 0.0) {
        wrapped += k_two_pi;
    }
    return wrapped - std::numbers::pi;
}

}  // namespace rover_sim
