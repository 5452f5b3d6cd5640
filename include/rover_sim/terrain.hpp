// === Terrain Collaborators ===================================================
//
// Read-only query surfaces the simulation core consumes: elevation lookup,
// terrain extents and nearby terrain objects. The core never decodes
// heightmaps itself; hosts supply an implementation. `ProceduralTerrain` and
// `RockField` are the host-side implementations used by the simulator app.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rover_sim/random_source.hpp"
#include "rover_sim/types.hpp"

namespace rover_sim {

/**
 * @brief Maps world (x, z) to elevation.
 *
 * Implementations must be side-effect free. A height of 0 is the sentinel
 * for "unknown"; the core substitutes its own fallback height.
 */
class TerrainHeightProvider {
  public:
    virtual ~TerrainHeightProvider() = default;

    [[nodiscard]] virtual double height_at_position(double x, double z) const = 0;
    [[nodiscard]] virtual TerrainDimensions terrain_dimensions() const = 0;
};

/** @brief Object resting on the terrain that rovers may survey. */
struct TerrainObject final {
    std::string identifier{};  /**< Stable identifier. */
    Vec2 location{};           /**< Position on the horizontal plane. */
    double size{};             /**< Approximate radius in world units. */
};

/**
 * @brief Answers proximity queries for rock-like terrain objects.
 */
class TerrainObjectQuery {
  public:
    virtual ~TerrainObjectQuery() = default;

    /** @brief Objects within @p radius of @p center, nearest first. */
    [[nodiscard]] virtual std::vector<TerrainObject> objects_within(const Vec2& center, double radius) const = 0;
};

/**
 * @brief Deterministic rolling relief used when no heightmap is available.
 */
class ProceduralTerrain final : public TerrainHeightProvider {
  public:
    ProceduralTerrain(TerrainDimensions dimensions, double relief);

    [[nodiscard]] double height_at_position(double x, double z) const override;
    [[nodiscard]] TerrainDimensions terrain_dimensions() const override;

  private:
    TerrainDimensions dimensions_;
    double relief_;
};

/**
 * @brief Fixed set of rocks scattered over the terrain at startup.
 */
class RockField final : public TerrainObjectQuery {
  public:
    RockField(const TerrainHeightProvider& terrain, std::size_t rock_count, RandomSource& random_source);

    [[nodiscard]] std::vector<TerrainObject> objects_within(const Vec2& center, double radius) const override;
    [[nodiscard]] const std::vector<TerrainObject>& rocks() const noexcept;

  private:
    std::vector<TerrainObject> list_rocks_;
};

}  // namespace rover_sim
