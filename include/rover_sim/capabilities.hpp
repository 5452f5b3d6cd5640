// === Rover Capabilities ======================================================
//
// Tunable numeric parameters of a rover and the canonical range table applied
// whenever they are assigned. Validation clamps; it never rejects.

#pragma once

#include <optional>

namespace rover_sim {

/**
 * @brief Performance envelope and battery state of a single rover.
 */
struct RoverCapabilities final {
    double max_speed{0.5};            /**< Nominal top speed in world units per tick. */
    double turn_rate{0.05};           /**< Turn rate in radians per second before tuning multiplier. */
    double sensor_range{100.0};       /**< Detection radius in world units. */
    double battery_capacity{100.0};   /**< Maximum charge. */
    double battery_level{100.0};      /**< Remaining charge, 0..battery_capacity. */
    double battery_drain_rate{0.01};  /**< Idle drain per second. */
};

/**
 * @brief Partial update; unset fields keep their current value.
 */
struct CapabilityPatch final {
    std::optional<double> max_speed{};
    std::optional<double> turn_rate{};
    std::optional<double> sensor_range{};
    std::optional<double> battery_capacity{};
    std::optional<double> battery_level{};
    std::optional<double> battery_drain_rate{};

    [[nodiscard]] bool empty() const noexcept;
};

/** @brief Inclusive bounds for one capability. */
struct CapabilityRange final {
    double min{};
    double max{};
};

inline constexpr CapabilityRange k_max_speed_range{0.1, 10.0};
inline constexpr CapabilityRange k_turn_rate_range{0.01, 1.0};
inline constexpr CapabilityRange k_sensor_range_range{10.0, 500.0};
inline constexpr CapabilityRange k_battery_capacity_range{50.0, 500.0};
inline constexpr CapabilityRange k_battery_drain_rate_range{0.001, 0.1};

/**
 * @brief Clamp every capability into its canonical range.
 *
 * Capacity is clamped before the level so the level bound is always the
 * final capacity. Non-finite inputs collapse to the lower bound. The
 * function is idempotent.
 */
[[nodiscard]] RoverCapabilities validate_capabilities(const RoverCapabilities& capabilities) noexcept;

/**
 * @brief Merge @p patch into @p current and validate the result.
 *
 * When the patch changes the capacity without naming a level, the current
 * charge fraction is preserved against the new capacity.
 */
[[nodiscard]] RoverCapabilities merge_capabilities(const RoverCapabilities& current, const CapabilityPatch& patch) noexcept;

}  // namespace rover_sim
