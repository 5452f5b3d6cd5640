#include <catch2/catch.hpp>

#include <cmath>
#include <string>
#include <vector>

#include "logging_test_fixture.hpp"
#include "rover_sim/rover_registry.hpp"
#include "test_doubles.hpp"

using namespace rover_sim;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rover_sim::test::ensure_logger_initialized();
    return true;
}();

constexpr std::uint32_t k_seed{1234};
constexpr double k_frame_ms{16.0};

const Vec2 k_rock_location{50.0, 0.0};

std::vector<TerrainObject> single_rock() {
    return {TerrainObject{"rock-1", k_rock_location, 20.0}};
}

double distance_to_rock(const Rover& rover) {
    return distance_xz(horizontal(rover.position), k_rock_location);
}

/**
 * @brief Tick until the rover reaches the rock; returns false if it never does.
 */
bool drive_to_rock(RoverRegistry& registry, const std::string& identifier) {
    for (int tick = 0; tick < 500; ++tick) {
        registry.update(k_frame_ms);
        if (registry.get_rover(identifier)->behavior_state.dwelling) {
            return true;
        }
    }
    return false;
}
}  // namespace

TEST_CASE("Patrol visits all four corners and closes the loop") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    CapabilityPatch patch{};
    patch.sensor_range = 10.0;
    patch.turn_rate = 1.0;
    patch.max_speed = 0.5;
    patch.battery_drain_rate = 0.001;
    REQUIRE(registry.set_capabilities(identifier, patch));
    REQUIRE(registry.set_task(identifier, "patrol"));

    registry.update(100.0);
    const Rover* rover = registry.get_rover(identifier);
    REQUIRE(rover->behavior_state.patrol_points.size() == 4);
    for (const Vec2& corner : rover->behavior_state.patrol_points) {
        REQUIRE(std::abs(corner.x) == Approx(20.0));
        REQUIRE(std::abs(corner.z) == Approx(20.0));
    }

    std::vector<std::size_t> list_visited{rover->behavior_state.patrol_index};
    for (int tick = 0; tick < 5'000 && list_visited.size() < 5; ++tick) {
        registry.update(100.0);
        const std::size_t index = registry.get_rover(identifier)->behavior_state.patrol_index;
        if (index != list_visited.back()) {
            list_visited.push_back(index);
        }
    }

    REQUIRE(list_visited == std::vector<std::size_t>{0, 1, 2, 3, 0});
}

TEST_CASE("Rock survey closes in on the rock, then holds still while examining") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    const test::FixedRockQuery rocks{single_rock()};
    RoverRegistry registry{terrain, bus, &rocks, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findRocks"));

    double previous_distance = distance_to_rock(*registry.get_rover(identifier));
    bool arrived = false;
    for (int tick = 0; tick < 500 && !arrived; ++tick) {
        registry.update(k_frame_ms);
        const Rover& rover = *registry.get_rover(identifier);
        const double distance = distance_to_rock(rover);
        REQUIRE(distance < previous_distance);
        previous_distance = distance;
        arrived = distance < 15.0;
    }
    REQUIRE(arrived);

    const Rover& examining = *registry.get_rover(identifier);
    REQUIRE(examining.speed == 0.0);
    REQUIRE(examining.behavior_state.dwelling);
    const Vec2 examined_at = horizontal(examining.position);

    const int dwell_ticks = static_cast<int>(registry.tuning().rocks_dwell_ms / k_frame_ms);
    for (int tick = 0; tick < dwell_ticks - 1; ++tick) {
        registry.update(k_frame_ms);
        const Rover& rover = *registry.get_rover(identifier);
        REQUIRE(rover.speed == 0.0);
        REQUIRE(rover.position.x == examined_at.x);
        REQUIRE(rover.position.z == examined_at.z);
    }

    for (int tick = 0; tick < 60; ++tick) {
        registry.update(k_frame_ms);
    }
    const Rover& resumed = *registry.get_rover(identifier);
    REQUIRE_FALSE(resumed.behavior_state.dwelling);
    REQUIRE(resumed.speed > 0.0);
    REQUIRE(resumed.behavior_state.examined_objects == std::vector<std::string>{"rock-1"});
}

TEST_CASE("Rock survey without nearby rocks wanders like random") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findRocks"));

    for (int tick = 0; tick < 100; ++tick) {
        REQUIRE_NOTHROW(registry.update(k_frame_ms));
    }
    const Rover& rover = *registry.get_rover(identifier);
    REQUIRE_FALSE(rover.behavior_state.target_position.has_value());
    REQUIRE(rover.position.x > 0.0);
}

TEST_CASE("A dwell timer from a previous goal does not touch the new goal") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    const test::FixedRockQuery rocks{single_rock()};
    RoverRegistry registry{terrain, bus, &rocks, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findRocks"));
    REQUIRE(drive_to_rock(registry, identifier));
    REQUIRE(registry.get_rover(identifier)->behavior_state.pending_actions.size() == 1);

    REQUIRE(registry.set_task(identifier, "random"));
    REQUIRE_FALSE(registry.get_rover(identifier)->target_speed.has_value());

    const int ticks_past_due = static_cast<int>(registry.tuning().rocks_dwell_ms / k_frame_ms) + 5;
    REQUIRE(ticks_past_due * k_frame_ms < registry.tuning().random_interval_min_ms);
    for (int tick = 0; tick < ticks_past_due; ++tick) {
        registry.update(k_frame_ms);
    }

    const Rover& rover = *registry.get_rover(identifier);
    REQUIRE(rover.behavior_goal == BehaviorGoal::Random);
    REQUIRE_FALSE(rover.target_speed.has_value());
    REQUIRE(rover.behavior_state.pending_actions.empty());
}

TEST_CASE("A restarted dwell outlives the timer of the dwell it replaced") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    const test::FixedRockQuery rocks{single_rock()};
    RoverRegistry registry{terrain, bus, &rocks, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findRocks"));
    REQUIRE(drive_to_rock(registry, identifier));
    const double first_dwell_started = registry.simulation_time_ms();

    for (int tick = 0; tick < 30; ++tick) {
        registry.update(k_frame_ms);
    }
    REQUIRE(registry.set_task(identifier, "findRocks"));
    REQUIRE(drive_to_rock(registry, identifier));

    const double first_dwell_due = first_dwell_started + registry.tuning().rocks_dwell_ms;
    while (registry.simulation_time_ms() < first_dwell_due + 5.0 * k_frame_ms) {
        registry.update(k_frame_ms);
    }

    const Rover& rover = *registry.get_rover(identifier);
    REQUIRE(rover.behavior_state.dwelling);
    REQUIRE(rover.speed == 0.0);
}

TEST_CASE("Standby holds the rover in place") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{-120.0, 64.0});
    REQUIRE(registry.set_task(identifier, "standby"));

    for (int tick = 0; tick < 200; ++tick) {
        registry.update(k_frame_ms);
    }
    const Rover& rover = *registry.get_rover(identifier);
    REQUIRE(rover.speed == 0.0);
    REQUIRE(rover.position.x == -120.0);
    REQUIRE(rover.position.z == 64.0);
}

TEST_CASE("Free-text tasks run the random goal") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "map the crater rim"));

    const Rover* rover = registry.get_rover(identifier);
    REQUIRE(rover->task == "map the crater rim");
    REQUIRE(rover->behavior_goal == BehaviorGoal::Random);

    for (int tick = 0; tick < 500; ++tick) {
        REQUIRE_NOTHROW(registry.update(k_frame_ms));
    }
    REQUIRE(distance_xz(horizontal(registry.get_rover(identifier)->position), Vec2{0.0, 0.0}) > 1.0);
}

TEST_CASE("Search goals drift while thinking, then commit to a search point") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    for (const std::string goal : {"findWater", "findGoodWeather", "findGoodSoil"}) {
        const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
        REQUIRE(registry.set_task(identifier, goal));

        for (int tick = 0; tick < 20; ++tick) {
            registry.update(k_frame_ms);
        }
        const Rover& thinking = *registry.get_rover(identifier);
        REQUIRE_FALSE(thinking.behavior_state.target_position.has_value());
        REQUIRE(distance_xz(horizontal(thinking.position), Vec2{0.0, 0.0}) > 0.0);

        for (int tick = 0; tick < 25; ++tick) {
            registry.update(k_frame_ms);
        }
        const Rover& searching = *registry.get_rover(identifier);
        REQUIRE(searching.behavior_state.target_position.has_value());
        const double reach = distance_xz(horizontal(searching.position), *searching.behavior_state.target_position);
        REQUIRE(reach <= searching.capabilities.sensor_range * 1.2 + 10.0);

        REQUIRE(registry.remove_rover(identifier));
    }
}

TEST_CASE("Flat-surface search settles on level ground") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findFlatSurface"));

    bool dwelled = false;
    for (int tick = 0; tick < 1'000 && !dwelled; ++tick) {
        registry.update(k_frame_ms);
        dwelled = registry.get_rover(identifier)->behavior_state.dwelling;
    }
    REQUIRE(dwelled);
    REQUIRE(registry.get_rover(identifier)->speed == 0.0);
}

TEST_CASE("Searching resumes with a fresh think phase after a dwell") {
    const test::FlatTerrain terrain{};
    test::RecordingBus bus{};
    const SimulationTuning tuning{};
    RoverRegistry registry{terrain, bus, nullptr, tuning, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    REQUIRE(registry.set_task(identifier, "findFlatSurface"));

    bool dwelled = false;
    for (int tick = 0; tick < 1'000 && !dwelled; ++tick) {
        registry.update(k_frame_ms);
        dwelled = registry.get_rover(identifier)->behavior_state.dwelling;
    }
    REQUIRE(dwelled);

    for (int tick = 0; tick < 1'000 && registry.get_rover(identifier)->behavior_state.dwelling; ++tick) {
        registry.update(k_frame_ms);
    }
    const Rover& resumed = *registry.get_rover(identifier);
    REQUIRE_FALSE(resumed.behavior_state.dwelling);
    REQUIRE(resumed.behavior_state.think_time_ms < tuning.flat_think_ms);

    const int think_ticks = static_cast<int>(tuning.flat_think_ms / k_frame_ms) - 2;
    for (int tick = 0; tick < think_ticks; ++tick) {
        registry.update(k_frame_ms);
        REQUIRE_FALSE(registry.get_rover(identifier)->behavior_state.target_position.has_value());
    }
}

TEST_CASE("Flat-surface search rejects steep ground and keeps sampling") {
    const test::SlopedTerrain terrain{0.5};
    test::RecordingBus bus{};
    RoverRegistry registry{terrain, bus, nullptr, SimulationTuning{}, k_seed};

    const std::string identifier = registry.create_rover(Vec2{0.0, 0.0});
    CapabilityPatch patch{};
    patch.turn_rate = 1.0;
    REQUIRE(registry.set_capabilities(identifier, patch));
    REQUIRE(registry.set_task(identifier, "findFlatSurface"));

    std::vector<Vec2> list_samples;
    for (int tick = 0; tick < 1'000; ++tick) {
        registry.update(k_frame_ms);
        const Rover& rover = *registry.get_rover(identifier);
        REQUIRE_FALSE(rover.behavior_state.dwelling);
        const auto& target = rover.behavior_state.target_position;
        if (target) {
            REQUIRE(target->x < rover.position.x);
            if (list_samples.empty() || list_samples.back().x != target->x) {
                list_samples.push_back(*target);
            }
        }
    }
    REQUIRE(list_samples.size() >= 2);
}
