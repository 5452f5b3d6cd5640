#include "rover_sim/progress_store.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "rover_sim/capabilities.hpp"
#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {

constexpr const char* k_root_key{"progress"};

void emit_point(YAML::Emitter& emitter, const char* key, const Vec2& point) {
    emitter << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginMap
            << YAML::Key << "x" << YAML::Value << point.x
            << YAML::Key << "z" << YAML::Value << point.z
            << YAML::EndMap;
}

void emit_record(YAML::Emitter& emitter, const ProgressRecord& record) {
    const RoverCapabilities& capabilities = record.capabilities;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "robotId" << YAML::Value << record.robot_id;
    emit_point(emitter, "position", record.position);
    emitter << YAML::Key << "height" << YAML::Value << record.height;
    emit_point(emitter, "coordinates", record.coordinates);
    emitter << YAML::Key << "behaviorGoal" << YAML::Value << std::string{to_string(record.behavior_goal)};
    emitter << YAML::Key << "speed" << YAML::Value << record.speed;
    emitter << YAML::Key << "capabilities" << YAML::Value << YAML::BeginMap
            << YAML::Key << "maxSpeed" << YAML::Value << capabilities.max_speed
            << YAML::Key << "turnRate" << YAML::Value << capabilities.turn_rate
            << YAML::Key << "sensorRange" << YAML::Value << capabilities.sensor_range
            << YAML::Key << "batteryCapacity" << YAML::Value << capabilities.battery_capacity
            << YAML::Key << "batteryLevel" << YAML::Value << capabilities.battery_level
            << YAML::Key << "batteryDrainRate" << YAML::Value << capabilities.battery_drain_rate
            << YAML::EndMap;
    emitter << YAML::EndMap;
}

double scalar_or(const YAML::Node& node, const char* key, double fallback) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        return fallback;
    }
    return value.as<double>(fallback);
}

RoverCapabilities parse_capabilities(const YAML::Node& node) {
    RoverCapabilities capabilities{};
    if (!node || !node.IsMap()) {
        return capabilities;
    }
    capabilities.max_speed = scalar_or(node, "maxSpeed", capabilities.max_speed);
    capabilities.turn_rate = scalar_or(node, "turnRate", capabilities.turn_rate);
    capabilities.sensor_range = scalar_or(node, "sensorRange", capabilities.sensor_range);
    capabilities.battery_capacity = scalar_or(node, "batteryCapacity", capabilities.battery_capacity);
    capabilities.battery_level = scalar_or(node, "batteryLevel", capabilities.battery_capacity);
    capabilities.battery_drain_rate = scalar_or(node, "batteryDrainRate", capabilities.battery_drain_rate);
    return validate_capabilities(capabilities);
}

std::optional<ProgressRecord> parse_record(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        get_logger()->warn("Skipping progress entry {}: not a mapping", index);
        return std::nullopt;
    }

    const YAML::Node robot_id = node["robotId"];
    const YAML::Node position = node["position"];
    if (!robot_id || !robot_id.IsScalar() || robot_id.Scalar().empty()) {
        get_logger()->warn("Skipping progress entry {}: missing robotId", index);
        return std::nullopt;
    }
    if (!position || !position.IsMap() || !position["x"] || !position["z"]) {
        get_logger()->warn("Skipping progress entry {} ({}): missing position", index, robot_id.Scalar());
        return std::nullopt;
    }

    ProgressRecord record{};
    try {
        record.robot_id = robot_id.as<std::string>();
        record.position = Vec2{position["x"].as<double>(), position["z"].as<double>()};
    } catch (const YAML::BadConversion& ex) {
        get_logger()->warn("Skipping progress entry {}: {}", index, ex.what());
        return std::nullopt;
    }

    record.height = scalar_or(node, "height", 0.0);
    const YAML::Node coordinates = node["coordinates"];
    if (coordinates && coordinates.IsMap()) {
        record.coordinates = Vec2{scalar_or(coordinates, "x", 0.0), scalar_or(coordinates, "z", 0.0)};
    }
    const YAML::Node goal = node["behaviorGoal"];
    if (goal && goal.IsScalar()) {
        record.behavior_goal = behavior_goal_from_string(goal.Scalar());
    }
    record.speed = scalar_or(node, "speed", 0.0);
    record.capabilities = parse_capabilities(node["capabilities"]);
    return record;
}

}  // namespace

ProgressStore::ProgressStore(std::filesystem::path path)
    : path_(std::move(path)) {}

void ProgressStore::save(const std::vector<ProgressRecord>& list_records) const {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap << YAML::Key << k_root_key << YAML::Value << YAML::BeginSeq;
    for (const ProgressRecord& record : list_records) {
        emit_record(emitter, record);
    }
    emitter << YAML::EndSeq << YAML::EndMap;
    if (!emitter.good()) {
        throw std::runtime_error("Failed to serialize progress: " + emitter.GetLastError());
    }

    if (path_.has_parent_path()) {
        std::error_code error_directory;
        std::filesystem::create_directories(path_.parent_path(), error_directory);
        if (error_directory) {
            throw std::runtime_error("Unable to create progress directory at " + path_.parent_path().string());
        }
    }

    std::ofstream stream{path_, std::ios::trunc};
    if (!stream) {
        throw std::runtime_error("Unable to open progress file " + path_.string());
    }
    stream << emitter.c_str() << '\n';
    if (!stream) {
        throw std::runtime_error("Failed to write progress file " + path_.string());
    }
    get_logger()->info("Saved {} rover record(s) to {}", list_records.size(), path_.string());
}

std::vector<ProgressRecord> ProgressStore::load() const {
    std::vector<ProgressRecord> list_records;
    if (!std::filesystem::exists(path_)) {
        get_logger()->info("No progress file at {}; starting fresh", path_.string());
        return list_records;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to parse progress file " + path_.string() + ": " + ex.what());
    }

    if (root.IsNull()) {
        get_logger()->warn("Progress file {} is empty", path_.string());
        return list_records;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Progress file " + path_.string() + " is not a mapping");
    }

    const YAML::Node list_nodes = root[k_root_key];
    if (!list_nodes) {
        get_logger()->warn("Progress file {} has no '{}' list", path_.string(), k_root_key);
        return list_records;
    }
    if (!list_nodes.IsSequence()) {
        throw std::runtime_error("Progress file " + path_.string() + ": '" + k_root_key + "' is not a list");
    }

    for (std::size_t index = 0; index < list_nodes.size(); ++index) {
        if (auto record = parse_record(list_nodes[index], index)) {
            list_records.push_back(std::move(*record));
        }
    }
    get_logger()->info("Loaded {} rover record(s) from {}", list_records.size(), path_.string());
    return list_records;
}

const std::filesystem::path& ProgressStore::path() const noexcept {
    return path_;
}

}  // namespace rover_sim
