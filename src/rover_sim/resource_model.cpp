#include "rover_sim/resource_model.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {
constexpr double k_milliseconds_per_second{1'000.0};
}  // namespace

ResourceModel::ResourceModel(const SimulationTuning& tuning)
    : tuning_(tuning) {}

bool ResourceModel::step(Rover& rover, double delta_ms, TimePoint wall_clock) const {
    RoverCapabilities& capabilities = rover.capabilities;
    const bool was_operational = capabilities.battery_level > 0.0;

    capabilities.battery_level = std::clamp(
        capabilities.battery_level - drain_for(rover, delta_ms),
        0.0,
        capabilities.battery_capacity
    );

    rover.effective_max_speed = speed_ceiling(rover);
    if (rover.target_speed && *rover.target_speed > rover.effective_max_speed) {
        rover.target_speed = rover.effective_max_speed;
    }

    const double charge_fraction = capabilities.battery_capacity > 0.0
        ? capabilities.battery_level / capabilities.battery_capacity
        : 0.0;
    if (charge_fraction < tuning_.distress_battery_fraction) {
        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wall_clock.time_since_epoch()).count();
        const auto half_period_ms = static_cast<long long>(tuning_.distress_flash_period_ms * 0.5);
        rover.distress = half_period_ms <= 0 || (elapsed_ms / half_period_ms) % 2 == 0;
    } else {
        rover.distress = false;
    }

    if (capabilities.battery_level <= 0.0) {
        rover.speed = 0.0;
        rover.target_speed = 0.0;
        if (was_operational) {
            get_logger()->info("Rover {} battery depleted; movement frozen", rover.identifier);
        }
        return false;
    }
    return true;
}

double ResourceModel::drain_for(const Rover& rover, double delta_ms) const {
    const double delta_seconds = delta_ms / k_milliseconds_per_second;
    double drain = rover.capabilities.battery_drain_rate * delta_seconds;
    drain += rover.speed * rover.speed * tuning_.speed_drain_coefficient * delta_seconds;
    if (is_turning(rover)) {
        drain += tuning_.turn_drain_per_second * delta_seconds;
    }
    return drain * goal_multiplier(rover.behavior_goal);
}

/**
 * @brief Below the low-battery threshold the ceiling shrinks with the charge
 *        left in that band, bottoming out at a fixed share of max speed.
 */
double ResourceModel::speed_ceiling(const Rover& rover) const {
    const RoverCapabilities& capabilities = rover.capabilities;
    const double low_threshold = capabilities.battery_capacity * tuning_.low_battery_fraction;
    if (low_threshold <= 0.0 || capabilities.battery_level >= low_threshold) {
        return capabilities.max_speed;
    }
    const double band_fraction = capabilities.battery_level / low_threshold;
    return capabilities.max_speed * std::max(tuning_.min_speed_ceiling_fraction, band_fraction);
}

double ResourceModel::goal_multiplier(BehaviorGoal goal) const noexcept {
    switch (goal) {
        case BehaviorGoal::Patrol:
        case BehaviorGoal::FindRocks:
            return tuning_.sensor_goal_drain_multiplier;
        case BehaviorGoal::Standby:
        case BehaviorGoal::FindGoodWeather:
            return tuning_.passive_goal_drain_multiplier;
        case BehaviorGoal::Random:
        case BehaviorGoal::FindWater:
        case BehaviorGoal::FindGoodSoil:
        case BehaviorGoal::FindFlatSurface:
            return 1.0;
    }
    return 1.0;
}

bool ResourceModel::is_turning(const Rover& rover) const {
    if (!rover.target_direction) {
        return false;
    }
    const double difference = normalize_angle(heading_of(*rover.target_direction) - heading_of(rover.direction));
    return std::abs(difference) > tuning_.turn_detect_threshold_rad;
}

}  // namespace rover_sim
