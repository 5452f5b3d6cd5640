// === Configuration ===========================================================
//
// Strongly-typed runtime knobs for the rover simulator host: logging, update
// cadence, procedural terrain, initial population and progress persistence.
// `ConfigurationLoader` translates environment variables into this structure
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "rover_sim/tuning.hpp"
#include "rover_sim/types.hpp"

namespace rover_sim {

/** @brief Procedural terrain parameters used when no heightmap is supplied. */
struct TerrainConfig final {
    double width{2'000.0};   /**< Extent along x in world units. */
    double height{2'000.0};  /**< Extent along z in world units. */
    double relief{300.0};    /**< Peak elevation of the procedural relief. */
};

/**
 * @brief Immutable bundle of runtime knobs for the rover simulation.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                         /**< Destination directory for structured logs. */
    std::optional<std::string> log_level;                /**< spdlog level name; unset keeps info. */
    double update_hz{};                                  /**< Simulation update cadence in Hertz. */
    TerrainConfig terrain{};                             /**< Procedural terrain settings. */
    std::size_t rock_count{};                            /**< Rocks scattered over the terrain. */
    std::size_t initial_rover_count{};                   /**< Rovers spawned when nothing is restored. */
    std::uint32_t random_seed{};                         /**< Zero requests a nondeterministic seed. */
    std::optional<std::filesystem::path> progress_file;  /**< Progress file; unset disables persistence. */
    Duration status_interval{};                          /**< Period of the per-rover status log. */
    SimulationTuning tuning{};                           /**< Simulation constants. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize logging and read every ROVER_SIM_* variable. */
    static Configuration load();

  private:
    static double load_update_hz();
};

}  // namespace rover_sim
