// === Rover Behaviors =========================================================
//
// Per-tick goal strategies. Each goal is a state of a per-rover state machine;
// the only transitions between goals are explicit task assignments made by the
// registry. Strategies mutate the rover's setpoints and target position and
// call into `RoverMovement` to integrate motion.
//
// Timed pauses (dwells, waypoint slowdowns) are deferred actions on the
// simulation clock. Each carries the goal assignment it was scheduled under
// and is dropped if that assignment changed before it falls due.

#pragma once

#include <optional>

#include "rover_sim/random_source.hpp"
#include "rover_sim/rover_movement.hpp"
#include "rover_sim/rover_state.hpp"
#include "rover_sim/terrain.hpp"
#include "rover_sim/tuning.hpp"

namespace rover_sim {

class RoverBehaviors final {
  public:
    /**
     * @param object_query Optional rock lookup; without it the rock survey
     *        falls back to random wandering.
     */
    RoverBehaviors(
        const TerrainHeightProvider& terrain,
        const TerrainObjectQuery* object_query,
        const RoverMovement& movement,
        RandomSource& random_source,
        const SimulationTuning& tuning
    );

    /**
     * @brief Run the rover's active goal for one tick.
     *
     * @param now_ms Simulation clock used for deferred actions.
     */
    void apply(Rover& rover, double delta_ms, double now_ms);

    /** @brief Draw a fresh interval between random heading changes. */
    [[nodiscard]] double next_move_interval();

  private:
    void run_due_actions(Rover& rover, double now_ms);
    void schedule(Rover& rover, DeferredEffect effect, double delay_ms, double now_ms);
    void apply_effect(Rover& rover, DeferredEffect effect);

    void apply_random(Rover& rover, double delta_ms);
    void apply_patrol(Rover& rover, double delta_ms, double now_ms);
    void apply_find_rocks(Rover& rover, double delta_ms, double now_ms);
    void apply_search(Rover& rover, const SearchProfile& profile, double delta_ms, double now_ms);
    void apply_find_flat_surface(Rover& rover, double delta_ms, double now_ms);

    void hold_position(Rover& rover) const;
    void begin_dwell(Rover& rover, double dwell_ms, double now_ms);
    void drift_while_thinking(Rover& rover, double delta_ms) const;
    [[nodiscard]] std::optional<TerrainObject> nearest_unexamined_rock(const Rover& rover) const;
    [[nodiscard]] double resume_fraction_for(BehaviorGoal goal) const noexcept;
    /** @brief Pull @p point inside the travel limits, @p arrival_radius clear of the edge. */
    [[nodiscard]] Vec2 reachable(const Vec2& point, double arrival_radius) const;

    const TerrainHeightProvider& terrain_;
    const TerrainObjectQuery* object_query_;
    const RoverMovement& movement_;
    RandomSource& random_source_;
    const SimulationTuning& tuning_;
};

}  // namespace rover_sim
