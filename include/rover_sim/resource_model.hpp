// === Resource Model ==========================================================
//
// Battery accounting applied once per rover per tick, before behavior and
// movement. Drain couples to activity (speed, turning, goal); low charge
// lowers the speed ceiling and an empty battery freezes the rover.

#pragma once

#include "rover_sim/rover_state.hpp"
#include "rover_sim/tuning.hpp"
#include "rover_sim/types.hpp"

namespace rover_sim {

class ResourceModel final {
  public:
    explicit ResourceModel(const SimulationTuning& tuning);

    /**
     * @brief Drain the battery and update the rover's speed ceiling.
     *
     * @param wall_clock Drives the cosmetic distress flash only.
     * @return false when the battery is empty; the caller must skip behavior
     *         and movement for this tick.
     */
    bool step(Rover& rover, double delta_ms, TimePoint wall_clock) const;

    /** @brief Charge consumed by @p rover over @p delta_ms at its current activity. */
    [[nodiscard]] double drain_for(const Rover& rover, double delta_ms) const;
    /** @brief Speed ceiling for the rover's current charge. */
    [[nodiscard]] double speed_ceiling(const Rover& rover) const;
    [[nodiscard]] double goal_multiplier(BehaviorGoal goal) const noexcept;

  private:
    [[nodiscard]] bool is_turning(const Rover& rover) const;

    const SimulationTuning& tuning_;
};

}  // namespace rover_sim
