#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rover_sim/capabilities.hpp"
#include "rover_sim/types.hpp"

namespace rover_sim {

/**
 * @brief Effect applied by a deferred action once it falls due.
 */
enum class DeferredEffect {
    RestorePatrolCruise,  /**< End the slowdown that follows a patrol waypoint. */
    FinishDwell           /**< End an examination and resume searching. */
};

/**
 * @brief Effect scheduled on the simulation clock.
 *
 * The goal and epoch captured at scheduling time act as a cancellation
 * token: the action is dropped if the rover no longer holds the same goal
 * assignment when it falls due.
 */
struct DeferredAction final {
    double due_ms{};                          /**< Simulation time at which the effect applies. */
    BehaviorGoal goal{BehaviorGoal::Random};  /**< Goal active when the action was scheduled. */
    std::uint64_t goal_epoch{};               /**< Goal assignment counter at scheduling time. */
    DeferredEffect effect{DeferredEffect::FinishDwell};
};

/**
 * @brief Transient working memory of the active behavior goal.
 */
struct BehaviorState final {
    std::optional<Vec2> target_position{};         /**< Point currently being sought. */
    std::vector<Vec2> patrol_points{};             /**< Patrol loop, built on the first patrol tick. */
    std::size_t patrol_index{};                    /**< Index of the patrol point being sought. */
    double think_time_ms{};                        /**< Accumulated think time. */
    double move_timer_ms{};                        /**< Time since the last random heading change. */
    double move_interval_ms{3'000.0};              /**< Time between random heading changes. */
    double cruise_fraction{1.0};                   /**< Current fraction of the speed ceiling for patrol. */
    bool dwelling{};                               /**< Rover is stationary examining a point. */
    std::optional<double> search_start_height{};   /**< Terrain height where a flat-surface search began. */
    std::optional<std::string> target_object{};    /**< Terrain object being approached. */
    std::vector<std::string> examined_objects{};   /**< Terrain objects already examined. */
    std::vector<DeferredAction> pending_actions{}; /**< Deferred effects awaiting their due time. */

    /**
     * @brief Clear goal working memory. Pending actions are kept so their
     *        cancellation check can observe the goal change.
     */
    void reset(double next_move_interval_ms);
};

/**
 * @brief Complete simulation record of a rover.
 */
struct Rover final {
    std::string identifier{};                          /**< Stable unique identifier. */
    Position position{};                               /**< World position; y follows the terrain. */
    double terrain_height{};                           /**< Resolved terrain height under the rover. */
    Vec2 direction{1.0, 0.0};                          /**< Unit heading on the horizontal plane. */
    double speed{0.5};                                 /**< Current speed, never negative. */
    std::optional<Vec2> target_direction{};            /**< Steering setpoint. */
    std::optional<double> target_speed{};              /**< Throttle setpoint. */
    std::string task{};                                /**< Free-text task label. */
    BehaviorGoal behavior_goal{BehaviorGoal::Random};  /**< Active autonomous strategy. */
    std::uint64_t goal_epoch{};                        /**< Incremented on each goal assignment. */
    BehaviorState behavior_state{};                    /**< Working memory of the active goal. */
    RoverCapabilities capabilities{};                  /**< Validated capability set. */
    double effective_max_speed{0.5};                   /**< Speed ceiling after battery degradation. */
    bool distress{};                                   /**< Low-battery flash phase for renderers. */
};

}  // namespace rover_sim
