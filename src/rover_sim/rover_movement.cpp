#include "rover_sim/rover_movement.hpp"

#include <algorithm>
#include <cmath>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {
constexpr double k_milliseconds_per_second{1'000.0};
constexpr double k_speed_time_base_ms{100.0};  /**< Time base of the fractional speed approach. */
}  // namespace

RoverMovement::RoverMovement(const TerrainHeightProvider& terrain, const SimulationTuning& tuning)
    : terrain_(terrain),
      tuning_(tuning) {}

void RoverMovement::smoothly_update_direction_and_speed(Rover& rover, double delta_ms) const {
    if (rover.target_direction) {
        update_direction(rover, delta_ms);
    }
    if (rover.target_speed) {
        update_speed(rover, delta_ms);
    }
}

MoveOutcome RoverMovement::move_toward_point(Rover& rover, const Vec2& target, double delta_ms, double cruise_fraction) const {
    const Vec2 offset{target.x - rover.position.x, target.z - rover.position.z};
    const double distance = length(offset);
    if (distance <= 0.0) {
        return MoveOutcome::AtTarget;
    }

    rover.target_direction = Vec2{offset.x / distance, offset.z / distance};

    const double cruise_speed = rover.effective_max_speed * cruise_fraction;
    if (distance < tuning_.approach_slowdown_distance) {
        const double ramp = std::max(tuning_.approach_min_speed_fraction, distance / tuning_.approach_slowdown_distance);
        rover.target_speed = cruise_speed * ramp;
    } else {
        rover.target_speed = cruise_speed;
    }

    smoothly_update_direction_and_speed(rover, delta_ms);

    const double step = rover.speed * tuning_.forward_bias;
    const double tentative_x = rover.position.x + rover.direction.x * step;
    const double tentative_z = rover.position.z + rover.direction.z * step;

    const Vec2 limits = travel_limits(terrain_.terrain_dimensions(), tuning_.boundary_margin);
    if (std::abs(tentative_x) > limits.x || std::abs(tentative_z) > limits.z) {
        rover.speed = 0.0;
        rover.target_speed = 0.0;
        rover.target_direction = Vec2{-rover.target_direction->x, -rover.target_direction->z};
        get_logger()->debug("Rover {} reached the terrain edge at ({:.1f}, {:.1f}); turning around",
                            rover.identifier, rover.position.x, rover.position.z);
        return MoveOutcome::BoundaryReversed;
    }

    rover.position.x = tentative_x;
    rover.position.z = tentative_z;
    return MoveOutcome::Advanced;
}

void RoverMovement::advance(Rover& rover, double factor, double lateral_offset) const {
    const Vec2 side{-rover.direction.z, rover.direction.x};
    const double step = rover.speed * factor;
    rover.position.x += (rover.direction.x + side.x * lateral_offset) * step;
    rover.position.z += (rover.direction.z + side.z * lateral_offset) * step;
}

void RoverMovement::update_direction(Rover& rover, double delta_ms) const {
    const double current_angle = heading_of(rover.direction);
    const double target_angle = heading_of(*rover.target_direction);
    const double angle_difference = normalize_angle(target_angle - current_angle);

    const double max_turn = rover.capabilities.turn_rate * tuning_.turn_rate_multiplier * delta_ms / k_milliseconds_per_second;
    const double turn_amount = std::copysign(std::min(std::abs(angle_difference), max_turn), angle_difference);

    rover.direction = unit_from_heading(current_angle + turn_amount);
}

void RoverMovement::update_speed(Rover& rover, double delta_ms) const {
    const double target_speed = *rover.target_speed;
    const double approach = std::min(1.0, tuning_.acceleration * delta_ms / k_speed_time_base_ms);
    rover.speed = std::max(0.0, rover.speed + (target_speed - rover.speed) * approach);

    if (target_speed > 0.0 && rover.speed < tuning_.minimum_moving_speed) {
        rover.speed = tuning_.minimum_moving_speed;
    }
}

}  // namespace rover_sim
