#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "logging_test_fixture.hpp"
#include "rover_sim/progress_store.hpp"
#include "rover_sim/rover_registry.hpp"
#include "test_doubles.hpp"

using namespace rover_sim;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rover_sim::test::ensure_logger_initialized();
    return true;
}();

std::filesystem::path scratch_file(const std::string& name) {
    const auto directory = std::filesystem::temp_directory_path() / "rover_sim_tests_progress";
    std::filesystem::create_directories(directory);
    const auto path = directory / name;
    std::filesystem::remove(path);
    return path;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream stream{path, std::ios::trunc};
    stream << text;
}
}  // namespace

TEST_CASE("Saved progress reloads into equivalent rovers") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry source{terrain, bus, nullptr, SimulationTuning{}, 5};

    const std::string patroller = source.create_rover(Vec2{-150.25, 75.5});
    REQUIRE(source.set_task(patroller, "patrol"));
    const std::string idler = source.create_rover(Vec2{300.0, -420.0});
    REQUIRE(source.set_task(idler, "standby"));
    CapabilityPatch patch{};
    patch.battery_capacity = 250.0;
    patch.battery_level = 60.0;
    patch.turn_rate = 0.2;
    REQUIRE(source.set_capabilities(idler, patch));

    const ProgressStore store{scratch_file("round_trip.yaml")};
    store.save(source.export_progress());
    REQUIRE(std::filesystem::exists(store.path()));

    const std::vector<ProgressRecord> list_loaded = store.load();
    REQUIRE(list_loaded.size() == 2);

    RoverRegistry target{terrain, bus, nullptr, SimulationTuning{}, 6};
    for (const ProgressRecord& record : list_loaded) {
        REQUIRE(target.restore_rover(record).has_value());
    }

    for (const std::string& identifier : {patroller, idler}) {
        const Rover* original = source.get_rover(identifier);
        const Rover* restored = target.get_rover(identifier);
        REQUIRE(restored != nullptr);
        REQUIRE(restored->behavior_goal == original->behavior_goal);
        REQUIRE(restored->position.x == Approx(original->position.x).margin(0.006));
        REQUIRE(restored->position.z == Approx(original->position.z).margin(0.006));
        REQUIRE(restored->capabilities.battery_capacity == Approx(original->capabilities.battery_capacity));
        REQUIRE(restored->capabilities.battery_level == Approx(original->capabilities.battery_level));
        REQUIRE(restored->capabilities.turn_rate == Approx(original->capabilities.turn_rate));
        REQUIRE(restored->capabilities.max_speed == Approx(original->capabilities.max_speed));
    }
}

TEST_CASE("A missing progress file loads as empty") {
    const ProgressStore store{scratch_file("does_not_exist.yaml")};
    REQUIRE(store.load().empty());
}

TEST_CASE("Malformed progress entries are skipped") {
    const auto path = scratch_file("partial.yaml");
    write_text(path,
               "progress:\n"
               "  - robotId: rover-9\n"
               "    position: {x: 10.5, z: -3.25}\n"
               "    behaviorGoal: findWater\n"
               "    capabilities: {maxSpeed: 40, batteryCapacity: 80}\n"
               "  - position: {x: 1, z: 2}\n"
               "  - robotId: rover-10\n"
               "    position: {x: 4}\n"
               "  - robotId: rover-11\n"
               "    position: {x: east, z: 2}\n"
               "  - just a string\n");

    const std::vector<ProgressRecord> list_loaded = ProgressStore{path}.load();
    REQUIRE(list_loaded.size() == 1);

    const ProgressRecord& record = list_loaded.front();
    REQUIRE(record.robot_id == "rover-9");
    REQUIRE(record.position.x == Approx(10.5));
    REQUIRE(record.position.z == Approx(-3.25));
    REQUIRE(record.behavior_goal == BehaviorGoal::FindWater);
    REQUIRE(record.capabilities.max_speed == Approx(10.0));
    REQUIRE(record.capabilities.battery_capacity == Approx(80.0));
    REQUIRE(record.capabilities.battery_level == Approx(80.0));
    REQUIRE(record.capabilities.turn_rate == Approx(RoverCapabilities{}.turn_rate));
}

TEST_CASE("Unparsable progress files are reported") {
    const auto path = scratch_file("broken.yaml");
    write_text(path, "progress: [ {robotId: rover-1, position: {x: 1\n");

    REQUIRE_THROWS_AS(ProgressStore{path}.load(), std::runtime_error);
}
