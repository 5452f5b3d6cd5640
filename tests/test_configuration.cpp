#include <catch2/catch.hpp>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

#include "logging_test_fixture.hpp"
#include "rover_sim/configuration.hpp"

using namespace rover_sim;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rover_sim::test::ensure_logger_initialized();
    return true;
}();

const std::vector<std::string> k_variables{
    "ROVER_SIM_UPDATE_HZ",
    "ROVER_SIM_TERRAIN_SIZE",
    "ROVER_SIM_TERRAIN_RELIEF",
    "ROVER_SIM_ROCK_COUNT",
    "ROVER_SIM_ROVER_COUNT",
    "ROVER_SIM_SEED",
    "ROVER_SIM_PROGRESS_FILE",
    "ROVER_SIM_STATUS_INTERVAL_S",
    "ROVER_SIM_LOG_LEVEL",
};

/** @brief Clears every simulator variable on entry and exit. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() {
        clear();
    }
    ~ScopedEnvironment() {
        clear();
    }

    void set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

  private:
    static void clear() {
        for (const std::string& name : k_variables) {
            ::unsetenv(name.c_str());
        }
    }
};
}  // namespace

TEST_CASE("Configuration falls back to defaults when the environment is empty") {
    ScopedEnvironment environment{};
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.update_hz == Approx(60.0));
    REQUIRE(config.terrain.width == Approx(2'000.0));
    REQUIRE(config.terrain.height == Approx(2'000.0));
    REQUIRE(config.terrain.relief == Approx(300.0));
    REQUIRE(config.rock_count == 5);
    REQUIRE(config.initial_rover_count == 3);
    REQUIRE(config.random_seed == 0);
    REQUIRE_FALSE(config.progress_file.has_value());
    REQUIRE_FALSE(config.log_level.has_value());
    REQUIRE(config.status_interval.count() == Approx(5.0));
}

TEST_CASE("Configuration honors valid overrides") {
    ScopedEnvironment environment{};
    environment.set("ROVER_SIM_UPDATE_HZ", "30");
    environment.set("ROVER_SIM_TERRAIN_SIZE", "800");
    environment.set("ROVER_SIM_TERRAIN_RELIEF", "120.5");
    environment.set("ROVER_SIM_ROCK_COUNT", "12");
    environment.set("ROVER_SIM_ROVER_COUNT", "7");
    environment.set("ROVER_SIM_SEED", "4242");
    environment.set("ROVER_SIM_PROGRESS_FILE", "/tmp/rover_progress.yaml");
    environment.set("ROVER_SIM_STATUS_INTERVAL_S", "0.5");
    environment.set("ROVER_SIM_LOG_LEVEL", "debug");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.update_hz == Approx(30.0));
    REQUIRE(config.terrain.width == Approx(800.0));
    REQUIRE(config.terrain.height == Approx(800.0));
    REQUIRE(config.terrain.relief == Approx(120.5));
    REQUIRE(config.rock_count == 12);
    REQUIRE(config.initial_rover_count == 7);
    REQUIRE(config.random_seed == 4242);
    REQUIRE(config.progress_file.has_value());
    REQUIRE(config.progress_file->string() == "/tmp/rover_progress.yaml");
    REQUIRE(config.status_interval.count() == Approx(0.5));
    REQUIRE(config.log_level == std::optional<std::string>{"debug"});
}

TEST_CASE("Configuration rejects unparsable or non-positive values") {
    ScopedEnvironment environment{};
    environment.set("ROVER_SIM_UPDATE_HZ", "fast");
    environment.set("ROVER_SIM_TERRAIN_SIZE", "-100");
    environment.set("ROVER_SIM_TERRAIN_RELIEF", "0");
    environment.set("ROVER_SIM_ROCK_COUNT", "many");
    environment.set("ROVER_SIM_ROVER_COUNT", "-2");
    environment.set("ROVER_SIM_SEED", "not-a-seed");
    environment.set("ROVER_SIM_STATUS_INTERVAL_S", "inf");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.update_hz == Approx(60.0));
    REQUIRE(config.terrain.width == Approx(2'000.0));
    REQUIRE(config.terrain.relief == Approx(300.0));
    REQUIRE(config.rock_count == 5);
    REQUIRE(config.initial_rover_count == 3);
    REQUIRE(config.random_seed == 0);
    REQUIRE(config.status_interval.count() == Approx(5.0));
}
