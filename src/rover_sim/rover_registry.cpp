#include "rover_sim/rover_registry.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

#include "rover_sim/logging.hpp"

namespace rover_sim {

RoverRegistry::RoverRegistry(
    const TerrainHeightProvider& terrain,
    NotificationBus& bus,
    const TerrainObjectQuery* object_query,
    SimulationTuning tuning,
    std::uint32_t seed
)
    : terrain_(terrain),
      bus_(bus),
      tuning_(tuning),
      random_source_(seed),
      movement_(terrain_, tuning_),
      resource_model_(tuning_),
      behaviors_(terrain_, object_query, movement_, random_source_, tuning_) {}

std::string RoverRegistry::create_rover(std::optional<Vec2> position) {
    Vec2 location{};
    if (position) {
        location = clamp_to_bounds(*position);
    } else {
        const TerrainDimensions dimensions = terrain_.terrain_dimensions();
        const double half_width = std::max(0.0, dimensions.width * 0.5 - tuning_.boundary_margin);
        const double half_height = std::max(0.0, dimensions.height * 0.5 - tuning_.boundary_margin);
        location = Vec2{
            random_source_.uniform(-half_width, half_width),
            random_source_.uniform(-half_height, half_height)
        };
    }

    Rover& rover = insert_rover(next_identifier(), location);
    get_logger()->info("Created rover {} at ({:.1f}, {:.1f}, {:.1f})",
                       rover.identifier, rover.position.x, rover.position.y, rover.position.z);
    publish(k_event_rover_added, rover);
    return rover.identifier;
}

RoverData RoverRegistry::add_rover(std::optional<Vec2> position) {
    const std::string identifier = create_rover(position);
    select_rover(identifier);
    return make_rover_data(map_rovers_.at(identifier), terrain_.terrain_dimensions(), true);
}

std::optional<std::string> RoverRegistry::restore_rover(const ProgressRecord& record) {
    if (record.robot_id.empty()) {
        get_logger()->warn("Ignoring progress record without a rover identifier");
        return std::nullopt;
    }
    if (map_rovers_.contains(record.robot_id)) {
        get_logger()->warn("Ignoring progress record for {}; a rover with that id already exists", record.robot_id);
        return std::nullopt;
    }

    Rover& rover = insert_rover(record.robot_id, clamp_to_bounds(record.position));
    rover.behavior_goal = record.behavior_goal;
    rover.task = std::string{to_string(record.behavior_goal)};
    rover.speed = std::isfinite(record.speed) ? std::max(0.0, record.speed) : 0.0;
    rover.capabilities = validate_capabilities(record.capabilities);
    rover.effective_max_speed = resource_model_.speed_ceiling(rover);

    get_logger()->info("Restored rover {} at ({:.1f}, {:.1f}) with goal {}",
                       rover.identifier, rover.position.x, rover.position.z, rover.task);
    publish(k_event_rover_added, rover);
    return rover.identifier;
}

bool RoverRegistry::select_rover(const std::optional<std::string>& identifier) {
    if (identifier && !map_rovers_.contains(*identifier)) {
        get_logger()->warn("Attempted to select unknown rover {}", *identifier);
        return false;
    }

    selected_rover_id_ = identifier;
    if (identifier) {
        get_logger()->info("Selected rover {}", *identifier);
        publish(k_event_rover_selected, map_rovers_.at(*identifier));
    } else {
        get_logger()->info("Cleared rover selection");
        bus_.notify(k_event_rover_selected, std::nullopt);
    }
    return true;
}

bool RoverRegistry::set_task(const std::string& identifier, const std::string& task) {
    Rover* rover = find_rover(identifier);
    if (rover == nullptr) {
        get_logger()->warn("Cannot set task on unknown rover {}", identifier);
        return false;
    }

    if (!is_known_goal(task)) {
        get_logger()->info("Task '{}' on rover {} is not a behavior goal; using {}",
                           task, identifier, to_string(BehaviorGoal::Random));
    }
    rover->task = task;
    rover->behavior_goal = behavior_goal_from_string(task);
    ++rover->goal_epoch;
    rover->behavior_state.reset(behaviors_.next_move_interval());
    rover->target_direction.reset();
    rover->target_speed.reset();

    get_logger()->info("Rover {} goal set to {}", identifier, to_string(rover->behavior_goal));
    publish(k_event_rover_updated, *rover);
    return true;
}

bool RoverRegistry::set_capabilities(const std::string& identifier, const CapabilityPatch& patch) {
    Rover* rover = find_rover(identifier);
    if (rover == nullptr) {
        get_logger()->warn("Cannot set capabilities on unknown rover {}", identifier);
        return false;
    }

    rover->capabilities = merge_capabilities(rover->capabilities, patch);
    rover->effective_max_speed = resource_model_.speed_ceiling(*rover);
    get_logger()->debug("Rover {} capabilities: speed {:.2f} turn {:.2f} sensor {:.0f} battery {:.1f}/{:.0f}",
                        identifier,
                        rover->capabilities.max_speed,
                        rover->capabilities.turn_rate,
                        rover->capabilities.sensor_range,
                        rover->capabilities.battery_level,
                        rover->capabilities.battery_capacity);
    publish(k_event_rover_updated, *rover);
    return true;
}

bool RoverRegistry::remove_rover(const std::string& identifier) {
    const auto iterator = map_rovers_.find(identifier);
    if (iterator == map_rovers_.end()) {
        get_logger()->warn("Cannot remove unknown rover {}", identifier);
        return false;
    }

    map_rovers_.erase(iterator);
    map_last_notified_ms_.erase(identifier);
    std::erase(list_rover_order_, identifier);
    get_logger()->info("Removed rover {}", identifier);

    if (selected_rover_id_ == identifier) {
        select_rover(std::nullopt);
    }
    return true;
}

/**
 * @brief Per rover: battery step, behavior (skipped when dead), boundary
 *        clamp, height resample, throttled notification.
 */
void RoverRegistry::update(double delta_ms) {
    if (!std::isfinite(delta_ms) || delta_ms < 0.0) {
        get_logger()->warn("Ignoring update with invalid delta {}", delta_ms);
        return;
    }

    simulation_time_ms_ += delta_ms;
    const TimePoint wall_clock = SteadyClock::now();

    const std::vector<std::string> list_identifiers = list_rover_order_;
    for (const std::string& identifier : list_identifiers) {
        Rover* rover = find_rover(identifier);
        if (rover == nullptr) {
            continue;
        }

        if (resource_model_.step(*rover, delta_ms, wall_clock)) {
            behaviors_.apply(*rover, delta_ms, simulation_time_ms_);
        }

        const Vec2 clamped = clamp_to_bounds(horizontal(rover->position));
        rover->position.x = clamped.x;
        rover->position.z = clamped.z;
        settle_on_terrain(*rover);

        publish_throttled(*rover);
    }
}

const Rover* RoverRegistry::get_rover(const std::string& identifier) const {
    const auto iterator = map_rovers_.find(identifier);
    return iterator == map_rovers_.end() ? nullptr : &iterator->second;
}

std::optional<RoverData> RoverRegistry::get_rover_data(const std::string& identifier) const {
    const Rover* rover = get_rover(identifier);
    if (rover == nullptr) {
        return std::nullopt;
    }
    return make_rover_data(*rover, terrain_.terrain_dimensions(), selected_rover_id_ == identifier);
}

std::vector<RoverData> RoverRegistry::get_all_rovers() const {
    const TerrainDimensions dimensions = terrain_.terrain_dimensions();
    std::vector<RoverData> list_data;
    list_data.reserve(list_rover_order_.size());
    for (const std::string& identifier : list_rover_order_) {
        list_data.push_back(make_rover_data(map_rovers_.at(identifier), dimensions, selected_rover_id_ == identifier));
    }
    return list_data;
}

std::optional<RoverData> RoverRegistry::get_selected_rover() const {
    if (!selected_rover_id_) {
        return std::nullopt;
    }
    return get_rover_data(*selected_rover_id_);
}

const std::optional<std::string>& RoverRegistry::selected_rover_id() const noexcept {
    return selected_rover_id_;
}

std::optional<ProgressRecord> RoverRegistry::get_progress_record(const std::string& identifier) const {
    const Rover* rover = get_rover(identifier);
    if (rover == nullptr) {
        return std::nullopt;
    }
    return make_progress_record(*rover, terrain_.terrain_dimensions());
}

std::vector<ProgressRecord> RoverRegistry::export_progress() const {
    const TerrainDimensions dimensions = terrain_.terrain_dimensions();
    std::vector<ProgressRecord> list_records;
    list_records.reserve(list_rover_order_.size());
    for (const std::string& identifier : list_rover_order_) {
        list_records.push_back(make_progress_record(map_rovers_.at(identifier), dimensions));
    }
    return list_records;
}

std::size_t RoverRegistry::size() const noexcept {
    return map_rovers_.size();
}

double RoverRegistry::simulation_time_ms() const noexcept {
    return simulation_time_ms_;
}

const SimulationTuning& RoverRegistry::tuning() const noexcept {
    return tuning_;
}

Rover* RoverRegistry::find_rover(const std::string& identifier) {
    const auto iterator = map_rovers_.find(identifier);
    return iterator == map_rovers_.end() ? nullptr : &iterator->second;
}

std::string RoverRegistry::next_identifier() {
    std::string identifier = fmt::format("rover-{}", next_rover_number_++);
    while (map_rovers_.contains(identifier)) {
        identifier = fmt::format("rover-{}", next_rover_number_++);
    }
    return identifier;
}

Rover& RoverRegistry::insert_rover(std::string identifier, const Vec2& position) {
    Rover rover{};
    rover.identifier = identifier;
    rover.position = Position{position.x, 0.0, position.z};
    rover.behavior_state.move_interval_ms = behaviors_.next_move_interval();
    rover.effective_max_speed = rover.capabilities.max_speed;
    settle_on_terrain(rover);

    list_rover_order_.push_back(identifier);
    return map_rovers_.emplace(std::move(identifier), std::move(rover)).first->second;
}

/**
 * @brief Terrain height at (x, z), substituting the fallback height when the
 *        provider reports (near) zero or a non-finite value.
 */
double RoverRegistry::resolve_height(double x, double z) const {
    const double height = terrain_.height_at_position(x, z);
    if (!std::isfinite(height) || std::abs(height) < tuning_.near_zero_height) {
        return tuning_.fallback_height;
    }
    return height;
}

Vec2 RoverRegistry::clamp_to_bounds(const Vec2& position) const {
    const Vec2 limits = travel_limits(terrain_.terrain_dimensions(), tuning_.boundary_margin);
    const double x = std::isfinite(position.x) ? position.x : 0.0;
    const double z = std::isfinite(position.z) ? position.z : 0.0;
    return Vec2{std::clamp(x, -limits.x, limits.x), std::clamp(z, -limits.z, limits.z)};
}

void RoverRegistry::settle_on_terrain(Rover& rover) {
    rover.terrain_height = resolve_height(rover.position.x, rover.position.z);
    rover.position.y = rover.terrain_height + tuning_.ground_clearance;
}

void RoverRegistry::publish(std::string_view event_name, const Rover& rover) {
    bus_.notify(event_name, make_rover_data(rover, terrain_.terrain_dimensions(), selected_rover_id_ == rover.identifier));
}

void RoverRegistry::publish_throttled(const Rover& rover) {
    const auto iterator = map_last_notified_ms_.find(rover.identifier);
    if (iterator != map_last_notified_ms_.end()
        && simulation_time_ms_ - iterator->second < tuning_.notification_interval_ms) {
        return;
    }
    map_last_notified_ms_[rover.identifier] = simulation_time_ms_;
    publish(k_event_rover_updated, rover);
}

}  // namespace rover_sim
