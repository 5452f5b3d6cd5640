// === Rover Movement ==========================================================
//
// Converts steering and throttle setpoints into frame-consistent changes of a
// rover's heading and speed, and implements point seeking with a terrain
// boundary check. Positions advance per tick by direction * speed * factor.

#pragma once

#include "rover_sim/rover_state.hpp"
#include "rover_sim/terrain.hpp"
#include "rover_sim/tuning.hpp"

namespace rover_sim {

/** @brief Result of a point-seeking step. */
enum class MoveOutcome {
    Advanced,          /**< Position moved toward the target. */
    AtTarget,          /**< Rover already sits on the target; nothing changed. */
    BoundaryReversed   /**< Step would leave the terrain; rover stopped and turned around. */
};

/**
 * @brief Movement integrator shared by every behavior strategy.
 */
class RoverMovement final {
  public:
    RoverMovement(const TerrainHeightProvider& terrain, const SimulationTuning& tuning);

    /**
     * @brief Rotate toward the target direction and approach the target speed.
     *
     * The turn per call is bounded by turn_rate * multiplier * dt and takes
     * the shorter way round. A positive target speed enforces a minimum
     * moving speed. The direction stays unit length.
     */
    void smoothly_update_direction_and_speed(Rover& rover, double delta_ms) const;

    /**
     * @brief Steer toward @p target, integrate and advance the position.
     *
     * @param cruise_fraction Share of the speed ceiling used away from the
     *        target; the approach ramps down to a minimum fraction of it.
     */
    MoveOutcome move_toward_point(Rover& rover, const Vec2& target, double delta_ms, double cruise_fraction = 1.0) const;

    /**
     * @brief Advance along the current heading by speed * @p factor.
     *
     * @param lateral_offset Sideways component, as a fraction of the forward
     *        step, added perpendicular to the heading.
     */
    void advance(Rover& rover, double factor, double lateral_offset = 0.0) const;

  private:
    void update_direction(Rover& rover, double delta_ms) const;
    void update_speed(Rover& rover, double delta_ms) const;

    const TerrainHeightProvider& terrain_;
    const SimulationTuning& tuning_;
};

}  // namespace rover_sim
