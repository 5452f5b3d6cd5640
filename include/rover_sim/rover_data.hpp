// === Rover Projections =======================================================
//
// Mesh-independent views of a rover handed to collaborators: the snapshot
// carried by notifications and queried by the UI, and the flat progress
// record exchanged with the persistence backend.

#pragma once

#include <string>

#include "rover_sim/capabilities.hpp"
#include "rover_sim/rover_state.hpp"
#include "rover_sim/types.hpp"

namespace rover_sim {

/**
 * @brief Snapshot of a rover for UI and render collaborators.
 */
struct RoverData final {
    std::string identifier{};                          /**< Rover identifier. */
    Position position{};                               /**< Position rounded to two decimals. */
    Vec2 direction{};                                  /**< Unit heading. */
    std::string task{};                                /**< Task label. */
    BehaviorGoal behavior_goal{BehaviorGoal::Random};  /**< Active goal. */
    double speed{};                                    /**< Current speed. */
    Vec2 coordinates{};                                /**< Map coordinates (origin at the terrain corner). */
    double height{};                                   /**< Terrain height, rounded. */
    bool selected{};                                   /**< Whether the registry has this rover selected. */
    RoverCapabilities capabilities{};                  /**< Capability set. */
    bool distress{};                                   /**< Low-battery flash phase. */
};

/**
 * @brief Flat per-rover record understood by the persistence backend.
 */
struct ProgressRecord final {
    std::string robot_id{};                            /**< Rover identifier. */
    Vec2 position{};                                   /**< Position rounded to two decimals. */
    double height{};                                   /**< Terrain height, rounded. */
    Vec2 coordinates{};                                /**< Map coordinates, rounded. */
    BehaviorGoal behavior_goal{BehaviorGoal::Random};  /**< Goal to resume. */
    double speed{};                                    /**< Speed at save time. */
    RoverCapabilities capabilities{};                  /**< Capability set. */
};

/** @brief Round @p value to @p decimals decimal places, half away from zero. */
[[nodiscard]] double round_to(double value, int decimals) noexcept;

[[nodiscard]] RoverData make_rover_data(const Rover& rover, const TerrainDimensions& dimensions, bool selected);

[[nodiscard]] ProgressRecord make_progress_record(const Rover& rover, const TerrainDimensions& dimensions);

}  // namespace rover_sim
