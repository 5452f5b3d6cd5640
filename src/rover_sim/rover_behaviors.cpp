#include "rover_sim/rover_behaviors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {

constexpr std::size_t k_patrol_corner_count{4};

std::vector<Vec2> make_square_patrol(const Vec2& center, double radius) {
    return {
        Vec2{center.x + radius, center.z + radius},
        Vec2{center.x - radius, center.z + radius},
        Vec2{center.x - radius, center.z - radius},
        Vec2{center.x + radius, center.z - radius},
    };
}

bool contains(const std::vector<std::string>& list_identifiers, const std::string& identifier) {
    return std::find(list_identifiers.begin(), list_identifiers.end(), identifier) != list_identifiers.end();
}

}  // namespace

RoverBehaviors::RoverBehaviors(
    const TerrainHeightProvider& terrain,
    const TerrainObjectQuery* object_query,
    const RoverMovement& movement,
    RandomSource& random_source,
    const SimulationTuning& tuning
)
    : terrain_(terrain),
      object_query_(object_query),
      movement_(movement),
      random_source_(random_source),
      tuning_(tuning) {}

void RoverBehaviors::apply(Rover& rover, double delta_ms, double now_ms) {
    if (rover.capabilities.battery_level <= 0.0) {
        rover.speed = 0.0;
        return;
    }

    run_due_actions(rover, now_ms);
    rover.behavior_state.think_time_ms += delta_ms;

    switch (rover.behavior_goal) {
        case BehaviorGoal::Random:
            apply_random(rover, delta_ms);
            return;
        case BehaviorGoal::Patrol:
            apply_patrol(rover, delta_ms, now_ms);
            return;
        case BehaviorGoal::FindRocks:
            apply_find_rocks(rover, delta_ms, now_ms);
            return;
        case BehaviorGoal::FindWater:
            apply_search(rover, tuning_.water, delta_ms, now_ms);
            return;
        case BehaviorGoal::FindGoodWeather:
            apply_search(rover, tuning_.weather, delta_ms, now_ms);
            return;
        case BehaviorGoal::FindGoodSoil:
            apply_search(rover, tuning_.soil, delta_ms, now_ms);
            return;
        case BehaviorGoal::FindFlatSurface:
            apply_find_flat_surface(rover, delta_ms, now_ms);
            return;
        case BehaviorGoal::Standby:
            hold_position(rover);
            return;
    }
    apply_random(rover, delta_ms);
}

double RoverBehaviors::next_move_interval() {
    return random_source_.uniform(tuning_.random_interval_min_ms, tuning_.random_interval_max_ms);
}

void RoverBehaviors::run_due_actions(Rover& rover, double now_ms) {
    std::vector<DeferredAction>& list_actions = rover.behavior_state.pending_actions;
    if (list_actions.empty()) {
        return;
    }

    std::vector<DeferredAction> list_due;
    const auto iterator_split = std::stable_partition(list_actions.begin(), list_actions.end(), [now_ms](const DeferredAction& action) {
        return action.due_ms > now_ms;
    });
    list_due.assign(iterator_split, list_actions.end());
    list_actions.erase(iterator_split, list_actions.end());

    for (const DeferredAction& action : list_due) {
        if (action.goal != rover.behavior_goal || action.goal_epoch != rover.goal_epoch) {
            get_logger()->debug("Rover {} dropped a stale {} action", rover.identifier, to_string(action.goal));
            continue;
        }
        apply_effect(rover, action.effect);
    }
}

void RoverBehaviors::schedule(Rover& rover, DeferredEffect effect, double delay_ms, double now_ms) {
    rover.behavior_state.pending_actions.push_back(
        DeferredAction{now_ms + delay_ms, rover.behavior_goal, rover.goal_epoch, effect}
    );
}

void RoverBehaviors::apply_effect(Rover& rover, DeferredEffect effect) {
    BehaviorState& state = rover.behavior_state;
    switch (effect) {
        case DeferredEffect::RestorePatrolCruise:
            state.cruise_fraction = tuning_.patrol_cruise_fraction;
            return;
        case DeferredEffect::FinishDwell:
            state.dwelling = false;
            state.target_position.reset();
            state.target_object.reset();
            state.search_start_height.reset();
            state.think_time_ms = 0.0;
            rover.target_speed = rover.effective_max_speed * resume_fraction_for(rover.behavior_goal);
            return;
    }
}

/**
 * @brief Keep the current heading, occasionally drawing a small or large turn
 *        and a speed jittered around a base fraction of the ceiling.
 */
void RoverBehaviors::apply_random(Rover& rover, double delta_ms) {
    BehaviorState& state = rover.behavior_state;
    state.move_timer_ms += delta_ms;

    if (state.move_timer_ms > state.move_interval_ms) {
        const double max_turn = random_source_.chance(tuning_.random_straight_preference)
            ? tuning_.random_small_turn_rad
            : tuning_.random_large_turn_rad;
        const double new_heading = heading_of(rover.direction) + random_source_.uniform(-max_turn, max_turn);
        rover.target_direction = unit_from_heading(new_heading);

        state.move_timer_ms = 0.0;
        state.move_interval_ms = next_move_interval();

        const double base_speed = rover.effective_max_speed * tuning_.random_base_speed_fraction;
        const double jitter = random_source_.uniform(-tuning_.random_speed_variance, tuning_.random_speed_variance);
        rover.target_speed = base_speed * (1.0 + jitter);
    }

    movement_.smoothly_update_direction_and_speed(rover, delta_ms);
    movement_.advance(rover, tuning_.random_move_factor);
}

void RoverBehaviors::apply_patrol(Rover& rover, double delta_ms, double now_ms) {
    BehaviorState& state = rover.behavior_state;
    if (state.patrol_points.size() != k_patrol_corner_count) {
        const double radius = rover.capabilities.sensor_range * tuning_.patrol_radius_factor;
        state.patrol_points = make_square_patrol(horizontal(rover.position), radius);
        for (Vec2& corner : state.patrol_points) {
            corner = reachable(corner, tuning_.patrol_arrival_radius);
        }
        state.patrol_index = 0;
        state.cruise_fraction = tuning_.patrol_cruise_fraction;
        get_logger()->info("Rover {} patrolling a square of radius {:.0f} around ({:.1f}, {:.1f})",
                           rover.identifier, radius, rover.position.x, rover.position.z);
    }
    state.patrol_index %= state.patrol_points.size();

    const Vec2 waypoint = state.patrol_points[state.patrol_index];
    const MoveOutcome outcome = movement_.move_toward_point(rover, waypoint, delta_ms, state.cruise_fraction);
    if (outcome == MoveOutcome::BoundaryReversed) {
        state.patrol_index = (state.patrol_index + 1) % state.patrol_points.size();
        return;
    }

    if (distance_xz(horizontal(rover.position), waypoint) < tuning_.patrol_arrival_radius) {
        state.patrol_index = (state.patrol_index + 1) % state.patrol_points.size();
        state.cruise_fraction = tuning_.patrol_waypoint_fraction;
        schedule(rover, DeferredEffect::RestorePatrolCruise, tuning_.patrol_slowdown_ms, now_ms);
        get_logger()->debug("Rover {} reached patrol waypoint; next index {}", rover.identifier, state.patrol_index);
    }
}

void RoverBehaviors::apply_find_rocks(Rover& rover, double delta_ms, double now_ms) {
    BehaviorState& state = rover.behavior_state;
    if (state.dwelling) {
        hold_position(rover);
        return;
    }

    if (!state.target_position) {
        const std::optional<TerrainObject> rock = nearest_unexamined_rock(rover);
        if (!rock) {
            apply_random(rover, delta_ms);
            return;
        }
        state.target_position = rock->location;
        state.target_object = rock->identifier;
        get_logger()->debug("Rover {} heading for {} at ({:.1f}, {:.1f})",
                            rover.identifier, rock->identifier, rock->location.x, rock->location.z);
    }

    const Vec2 target = *state.target_position;
    const MoveOutcome outcome = movement_.move_toward_point(rover, target, delta_ms, tuning_.rocks_cruise_fraction);
    if (outcome == MoveOutcome::BoundaryReversed) {
        if (state.target_object) {
            state.examined_objects.push_back(*state.target_object);
        }
        state.target_position.reset();
        state.target_object.reset();
        return;
    }

    if (distance_xz(horizontal(rover.position), target) < tuning_.rocks_arrival_radius) {
        if (state.target_object) {
            state.examined_objects.push_back(*state.target_object);
            get_logger()->info("Rover {} examining {}", rover.identifier, *state.target_object);
        }
        begin_dwell(rover, tuning_.rocks_dwell_ms, now_ms);
    }
}

/**
 * @brief Think, pick a point inside the goal's envelope, seek it, then roll
 *        for a discovery.
 */
void RoverBehaviors::apply_search(Rover& rover, const SearchProfile& profile, double delta_ms, double now_ms) {
    BehaviorState& state = rover.behavior_state;
    if (state.dwelling) {
        hold_position(rover);
        return;
    }

    if (!state.target_position) {
        if (state.think_time_ms <= profile.think_ms) {
            drift_while_thinking(rover, delta_ms);
            return;
        }
        state.think_time_ms = 0.0;

        const double heading = profile.relative_to_heading
            ? heading_of(rover.direction) + random_source_.uniform(-profile.angle_spread_rad, profile.angle_spread_rad)
            : random_source_.uniform(-profile.angle_spread_rad, profile.angle_spread_rad);
        const double distance = rover.capabilities.sensor_range
            * random_source_.uniform(profile.min_distance_factor, profile.max_distance_factor);
        const Vec2 offset = unit_from_heading(heading);
        state.target_position = reachable(
            Vec2{rover.position.x + offset.x * distance, rover.position.z + offset.z * distance},
            profile.arrival_radius
        );
        rover.target_speed = rover.effective_max_speed * profile.cruise_fraction;
        get_logger()->debug("Rover {} searching ({}) toward ({:.1f}, {:.1f})", rover.identifier,
                            to_string(rover.behavior_goal), state.target_position->x, state.target_position->z);
        return;
    }

    const Vec2 target = *state.target_position;
    const MoveOutcome outcome = movement_.move_toward_point(rover, target, delta_ms, profile.cruise_fraction);
    if (outcome == MoveOutcome::BoundaryReversed) {
        state.target_position.reset();
        return;
    }

    if (distance_xz(horizontal(rover.position), target) < profile.arrival_radius) {
        if (random_source_.chance(profile.success_probability)) {
            get_logger()->info("Rover {} succeeded at {} near ({:.1f}, {:.1f})",
                               rover.identifier, to_string(rover.behavior_goal), target.x, target.z);
            begin_dwell(rover, profile.dwell_ms, now_ms);
        } else {
            state.target_position.reset();
        }
    }
}

/**
 * @brief Sample a ring around the rover, seek the lowest sample and accept it
 *        if the height change along the way stays under the threshold.
 */
void RoverBehaviors::apply_find_flat_surface(Rover& rover, double delta_ms, double now_ms) {
    BehaviorState& state = rover.behavior_state;
    if (state.dwelling) {
        hold_position(rover);
        return;
    }

    if (!state.target_position) {
        if (state.think_time_ms <= tuning_.flat_think_ms) {
            rover.target_speed = rover.effective_max_speed * tuning_.think_speed_fraction;
            movement_.smoothly_update_direction_and_speed(rover, delta_ms);
            movement_.advance(rover, 1.0);
            return;
        }
        state.think_time_ms = 0.0;

        const int sample_count = std::max(1, tuning_.flat_ring_samples);
        const double radius = rover.capabilities.sensor_range * tuning_.flat_ring_radius_factor;
        std::optional<Vec2> lowest_sample;
        double lowest_height = 0.0;
        for (int index = 0; index < sample_count; ++index) {
            const Vec2 offset = unit_from_heading(2.0 * std::numbers::pi * index / sample_count);
            const Vec2 sample = reachable(
                Vec2{rover.position.x + offset.x * radius, rover.position.z + offset.z * radius},
                tuning_.flat_arrival_radius
            );
            const double sample_height = terrain_.height_at_position(sample.x, sample.z);
            if (!lowest_sample || sample_height < lowest_height) {
                lowest_sample = sample;
                lowest_height = sample_height;
            }
        }

        state.target_position = lowest_sample;
        state.search_start_height = terrain_.height_at_position(rover.position.x, rover.position.z);
        rover.target_speed = rover.effective_max_speed * tuning_.flat_cruise_fraction;
        return;
    }

    const Vec2 target = *state.target_position;
    const MoveOutcome outcome = movement_.move_toward_point(rover, target, delta_ms, tuning_.flat_cruise_fraction);
    if (outcome == MoveOutcome::BoundaryReversed) {
        state.target_position.reset();
        state.search_start_height.reset();
        return;
    }

    if (distance_xz(horizontal(rover.position), target) < tuning_.flat_arrival_radius) {
        const double end_height = terrain_.height_at_position(rover.position.x, rover.position.z);
        const double height_change = std::abs(end_height - state.search_start_height.value_or(end_height));
        if (height_change <= tuning_.flat_height_threshold) {
            get_logger()->info("Rover {} found flat ground at ({:.1f}, {:.1f})", rover.identifier, target.x, target.z);
            begin_dwell(rover, tuning_.flat_dwell_ms, now_ms);
            return;
        }
        get_logger()->debug("Rover {} rejected ground with height change {:.1f}; resampling", rover.identifier, height_change);
        state.target_position.reset();
        state.search_start_height.reset();
        state.think_time_ms = tuning_.flat_think_ms;
    }
}

void RoverBehaviors::hold_position(Rover& rover) const {
    rover.speed = 0.0;
    rover.target_speed = 0.0;
}

void RoverBehaviors::begin_dwell(Rover& rover, double dwell_ms, double now_ms) {
    rover.behavior_state.dwelling = true;
    hold_position(rover);
    schedule(rover, DeferredEffect::FinishDwell, dwell_ms, now_ms);
}

/**
 * @brief Keep moving with a sinusoidal sideways sway instead of idling.
 */
void RoverBehaviors::drift_while_thinking(Rover& rover, double delta_ms) const {
    rover.target_speed = rover.effective_max_speed * tuning_.think_speed_fraction;
    movement_.smoothly_update_direction_and_speed(rover, delta_ms);
    const double zigzag = std::sin(rover.behavior_state.think_time_ms * tuning_.zigzag_frequency) * tuning_.zigzag_amplitude;
    movement_.advance(rover, 1.0, zigzag);
}

std::optional<TerrainObject> RoverBehaviors::nearest_unexamined_rock(const Rover& rover) const {
    if (object_query_ == nullptr) {
        return std::nullopt;
    }
    const std::vector<TerrainObject> list_nearby = object_query_->objects_within(horizontal(rover.position), rover.capabilities.sensor_range);
    for (const TerrainObject& rock : list_nearby) {
        if (!contains(rover.behavior_state.examined_objects, rock.identifier)) {
            return rock;
        }
    }
    return std::nullopt;
}

double RoverBehaviors::resume_fraction_for(BehaviorGoal goal) const noexcept {
    switch (goal) {
        case BehaviorGoal::FindRocks:
            return tuning_.rocks_resume_fraction;
        case BehaviorGoal::FindWater:
            return tuning_.water.resume_fraction;
        case BehaviorGoal::FindGoodWeather:
            return tuning_.weather.resume_fraction;
        case BehaviorGoal::FindGoodSoil:
            return tuning_.soil.resume_fraction;
        case BehaviorGoal::FindFlatSurface:
            return tuning_.flat_resume_fraction;
        case BehaviorGoal::Random:
        case BehaviorGoal::Patrol:
        case BehaviorGoal::Standby:
            return 0.0;
    }
    return 0.0;
}

Vec2 RoverBehaviors::reachable(const Vec2& point, double arrival_radius) const {
    const Vec2 limits = travel_limits(terrain_.terrain_dimensions(), tuning_.boundary_margin + arrival_radius);
    return Vec2{std::clamp(point.x, -limits.x, limits.x), std::clamp(point.z, -limits.z, limits.z)};
}

}  // namespace rover_sim
