// === Simulation Tuning =======================================================
//
// Canonical parameter set for the movement integrator, behavior strategies,
// resource model and registry. Values are tunable defaults; the registry owns
// one instance and lends it to the strategy objects it constructs.

#pragma once

#include <numbers>

namespace rover_sim {

/**
 * @brief Parameters for the think/seek/dwell search strategies.
 */
struct SearchProfile final {
    double think_ms{};                /**< Accumulated think time before choosing a search point. */
    double angle_spread_rad{};        /**< Half-width of the angular search envelope. */
    bool relative_to_heading{};       /**< Centre the envelope on the current heading instead of a full circle. */
    double min_distance_factor{};     /**< Minimum search distance as a fraction of sensor range. */
    double max_distance_factor{};     /**< Maximum search distance as a fraction of sensor range. */
    double arrival_radius{};          /**< Distance at which a search point counts as reached. */
    double success_probability{};     /**< Chance that a reached point yields a discovery. */
    double dwell_ms{};                /**< Examination time after a discovery. */
    double cruise_fraction{};         /**< Fraction of the speed ceiling used while seeking. */
    double resume_fraction{};         /**< Fraction of the speed ceiling restored after dwelling. */
};

/**
 * @brief Every tunable constant of the simulation core.
 */
struct SimulationTuning final {
    // Movement integrator
    double turn_rate_multiplier{2.5};
    double acceleration{0.3};
    double minimum_moving_speed{0.2};
    double forward_bias{1.2};
    double approach_slowdown_distance{20.0};
    double approach_min_speed_fraction{0.4};

    // Random wandering
    double random_move_factor{1.0};
    double random_interval_min_ms{1'500.0};
    double random_interval_max_ms{5'000.0};
    double random_straight_preference{0.6};
    double random_small_turn_rad{std::numbers::pi / 12.0};
    double random_large_turn_rad{std::numbers::pi / 4.0};
    double random_base_speed_fraction{0.4};
    double random_speed_variance{0.2};

    // Patrol
    double patrol_radius_factor{2.0};
    double patrol_arrival_radius{15.0};
    double patrol_cruise_fraction{0.95};
    double patrol_waypoint_fraction{0.6};
    double patrol_slowdown_ms{200.0};

    // Rock survey
    double rocks_arrival_radius{15.0};
    double rocks_dwell_ms{1'200.0};
    double rocks_cruise_fraction{1.0};
    double rocks_resume_fraction{0.9};

    // Think-time drift shared by the search goals
    double think_speed_fraction{0.7};
    double zigzag_amplitude{0.3};
    double zigzag_frequency{0.01};

    SearchProfile water{500.0, std::numbers::pi / 2.0, true, 0.5, 1.0, 12.0, 0.35, 700.0, 0.85, 0.8};
    SearchProfile weather{500.0, std::numbers::pi, false, 0.8, 1.2, 12.0, 0.5, 700.0, 0.85, 0.9};
    SearchProfile soil{600.0, std::numbers::pi, false, 0.6, 1.1, 10.0, 0.4, 800.0, 0.85, 0.8};

    // Flat surface survey
    int flat_ring_samples{8};
    double flat_ring_radius_factor{0.5};
    double flat_think_ms{450.0};
    double flat_arrival_radius{15.0};
    double flat_height_threshold{5.0};
    double flat_dwell_ms{800.0};
    double flat_cruise_fraction{0.9};
    double flat_resume_fraction{0.9};

    // Resource model
    double speed_drain_coefficient{0.01};
    double turn_drain_per_second{0.05};
    double turn_detect_threshold_rad{1e-3};
    double sensor_goal_drain_multiplier{1.5};
    double passive_goal_drain_multiplier{0.5};
    double low_battery_fraction{0.2};
    double min_speed_ceiling_fraction{0.3};
    double distress_battery_fraction{0.05};
    double distress_flash_period_ms{500.0};

    // Registry
    double boundary_margin{50.0};
    double ground_clearance{5.0};
    double fallback_height{20.0};
    double near_zero_height{0.1};
    double notification_interval_ms{100.0};
};

}  // namespace rover_sim
