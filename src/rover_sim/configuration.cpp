// === Configuration Loader ====================================================
//
// Parses and validates the environment-driven settings that feed the
// simulation runtime and returns them as a fully-populated `Configuration`.
//
// Responsibilities
// - Enforce defaults and sane bounds for knobs such as update cadence,
//   terrain extent and initial rover count.
// - Log a warning whenever a value cannot be parsed or is out of range, then
//   fall back to the default.
//
// Callers populate the process environment ahead of time (shell, launch
// configuration or a sourced `.env`); nothing is read from disk here.

#include "rover_sim/configuration.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {
constexpr double k_default_update_hz{60.0};
constexpr double k_default_terrain_size{2'000.0};
constexpr double k_default_terrain_relief{300.0};
constexpr int k_default_rock_count{5};
constexpr int k_default_rover_count{3};
constexpr double k_default_status_interval_s{5.0};
constexpr std::string_view k_default_log_directory{"logs"};

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!(parsed_value > 0.0) || parsed_value == std::numeric_limits<double>::infinity()) {
            get_logger()->warn("{}={} must be positive; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a number; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{}={} must be positive; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as an integer; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

std::uint32_t parse_seed() {
    const char* raw_value = std::getenv("ROVER_SIM_SEED");
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return 0;
    }
    try {
        const unsigned long parsed_value = std::stoul(raw_value);
        if (parsed_value > std::numeric_limits<std::uint32_t>::max()) {
            get_logger()->warn("ROVER_SIM_SEED={} is out of range; using a random seed", raw_value);
            return 0;
        }
        return static_cast<std::uint32_t>(parsed_value);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse ROVER_SIM_SEED={}; using a random seed", raw_value);
        return 0;
    }
}

std::optional<std::filesystem::path> parse_progress_file() {
    const char* raw_path = std::getenv("ROVER_SIM_PROGRESS_FILE");
    if (raw_path == nullptr || std::string_view{raw_path}.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path{raw_path};
}

std::optional<std::string> parse_log_level() {
    const char* raw_level = std::getenv("ROVER_SIM_LOG_LEVEL");
    if (raw_level == nullptr || std::string_view{raw_level}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_level};
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("ROVER_SIM_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();
    config.log_level = parse_log_level();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.update_hz = load_update_hz();

    const double terrain_size = parse_double("ROVER_SIM_TERRAIN_SIZE", k_default_terrain_size);
    config.terrain.width = terrain_size;
    config.terrain.height = terrain_size;
    config.terrain.relief = parse_double("ROVER_SIM_TERRAIN_RELIEF", k_default_terrain_relief);

    config.rock_count = static_cast<std::size_t>(parse_int("ROVER_SIM_ROCK_COUNT", k_default_rock_count));
    config.initial_rover_count = static_cast<std::size_t>(parse_int("ROVER_SIM_ROVER_COUNT", k_default_rover_count));
    config.random_seed = parse_seed();
    config.progress_file = parse_progress_file();
    config.status_interval = Duration{parse_double("ROVER_SIM_STATUS_INTERVAL_S", k_default_status_interval_s)};

    logger->info("Configuration loaded: update_hz={} terrain={}x{} relief={} rocks={} rovers={} seed={} progress_file={}",
                 config.update_hz,
                 config.terrain.width,
                 config.terrain.height,
                 config.terrain.relief,
                 config.rock_count,
                 config.initial_rover_count,
                 config.random_seed,
                 config.progress_file ? config.progress_file->string() : std::string{"<disabled>"});

    return config;
}

double ConfigurationLoader::load_update_hz() {
    return parse_double("ROVER_SIM_UPDATE_HZ", k_default_update_hz);
}

}  // namespace rover_sim
