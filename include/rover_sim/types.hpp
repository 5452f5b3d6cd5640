// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the rover simulation (time primitives, planar vectors, terrain extents and
// the behavior goal enumeration).

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <string_view>

namespace rover_sim {

/**
 * @brief Alias for the steady clock used for wall-clock effects.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Vector on the horizontal (x, z) plane of the terrain.
 */
struct Vec2 final {
    double x{};  /**< World X component. */
    double z{};  /**< World Z component. */
};

/**
 * @brief World-space position; y is derived from the terrain height.
 */
struct Position final {
    double x{};  /**< World X coordinate. */
    double y{};  /**< Elevation including ground clearance. */
    double z{};  /**< World Z coordinate. */
};

/**
 * @brief Full extents of the terrain, centred on the world origin.
 */
struct TerrainDimensions final {
    double width{};   /**< Extent along X in world units. */
    double height{};  /**< Extent along Z in world units. */
};

/**
 * @brief Enumerates the autonomous strategies a rover can follow.
 */
enum class BehaviorGoal {
    Random,           /**< Wander with occasional heading changes. */
    Patrol,           /**< Loop a square path around the starting point. */
    FindRocks,        /**< Seek and examine nearby rocks. */
    FindWater,        /**< Search for water sources. */
    FindGoodWeather,  /**< Search for favourable weather conditions. */
    FindGoodSoil,     /**< Search for fertile soil. */
    FindFlatSurface,  /**< Look for level ground. */
    Standby           /**< Hold position. */
};

/** @brief Identifier used by the UI and persistence layer for @p goal. */
[[nodiscard]] std::string_view to_string(BehaviorGoal goal);

/**
 * @brief Interpret free task text as a goal; unknown text maps to Random.
 */
[[nodiscard]] BehaviorGoal behavior_goal_from_string(std::string_view text) noexcept;

/** @brief Whether @p text names a known goal exactly. */
[[nodiscard]] bool is_known_goal(std::string_view text) noexcept;

[[nodiscard]] inline double length(const Vec2& vector) noexcept {
    return std::hypot(vector.x, vector.z);
}

[[nodiscard]] inline double distance_xz(const Vec2& from, const Vec2& to) noexcept {
    return std::hypot(to.x - from.x, to.z - from.z);
}

[[nodiscard]] inline Vec2 horizontal(const Position& position) noexcept {
    return Vec2{position.x, position.z};
}

/**
 * @brief Largest |x| and |z| a rover may occupy: half of each extent less
 *        @p margin, never negative.
 */
[[nodiscard]] inline Vec2 travel_limits(const TerrainDimensions& dimensions, double margin) noexcept {
    return Vec2{
        std::max(0.0, dimensions.width * 0.5 - margin),
        std::max(0.0, dimensions.height * 0.5 - margin)
    };
}

/**
 * @brief Wrap an angle into the half-open interval (-pi, pi].
 */
[[nodiscard]] double normalize_angle(double angle_rad) noexcept;

/** @brief Heading of @p direction measured from +X toward +Z. */
[[nodiscard]] inline double heading_of(const Vec2& direction) noexcept {
    return std::atan2(direction.z, direction.x);
}

[[nodiscard]] inline Vec2 unit_from_heading(double heading_rad) noexcept {
    return Vec2{std::cos(heading_rad), std::sin(heading_rad)};
}

}  // namespace rover_sim
