#include "rover_sim/rover_data.hpp"

#include <cmath>

namespace rover_sim {

namespace {

constexpr int k_position_decimals{2};

Vec2 map_coordinates(const Position& position, const TerrainDimensions& dimensions) {
    return Vec2{
        std::round(position.x + dimensions.width * 0.5),
        std::round(position.z + dimensions.height * 0.5)
    };
}

}  // namespace

double round_to(double value, int decimals) noexcept {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

RoverData make_rover_data(const Rover& rover, const TerrainDimensions& dimensions, bool selected) {
    RoverData data{};
    data.identifier = rover.identifier;
    data.position = Position{
        round_to(rover.position.x, k_position_decimals),
        round_to(rover.position.y, k_position_decimals),
        round_to(rover.position.z, k_position_decimals)
    };
    data.direction = rover.direction;
    data.task = rover.task;
    data.behavior_goal = rover.behavior_goal;
    data.speed = rover.speed;
    data.coordinates = map_coordinates(rover.position, dimensions);
    data.height = std::round(rover.terrain_height);
    data.selected = selected;
    data.capabilities = rover.capabilities;
    data.distress = rover.distress;
    return data;
}

ProgressRecord make_progress_record(const Rover& rover, const TerrainDimensions& dimensions) {
    ProgressRecord record{};
    record.robot_id = rover.identifier;
    record.position = Vec2{
        round_to(rover.position.x, k_position_decimals),
        round_to(rover.position.z, k_position_decimals)
    };
    record.height = std::round(rover.terrain_height);
    record.coordinates = map_coordinates(rover.position, dimensions);
    record.behavior_goal = rover.behavior_goal;
    record.speed = rover.speed;
    record.capabilities = rover.capabilities;
    return record;
}

}  // namespace rover_sim
