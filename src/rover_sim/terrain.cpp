#include "rover_sim/terrain.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {

constexpr double k_primary_frequency{0.005};   /**< Broad undulation across the map. */
constexpr double k_ridge_frequency_x{0.002};   /**< Diagonal ridge frequency along X. */
constexpr double k_ridge_frequency_z{0.003};   /**< Diagonal ridge frequency along Z. */
constexpr double k_rock_min_size{10.0};
constexpr double k_rock_max_size{40.0};
constexpr double k_rock_spread_fraction{0.9};  /**< Rocks stay inside this share of the extent. */

}  // namespace

ProceduralTerrain::ProceduralTerrain(TerrainDimensions dimensions, double relief)
    : dimensions_(dimensions),
      relief_(relief) {
    if (dimensions_.width <= 0.0 || dimensions_.height <= 0.0) {
        throw std::invalid_argument("ProceduralTerrain dimensions must be positive");
    }
    if (relief_ <= 0.0) {
        throw std::invalid_argument("ProceduralTerrain relief must be positive");
    }
}

/**
 * @brief Sample the relief, clamping queries to the terrain edge like a heightmap lookup.
 */
double ProceduralTerrain::height_at_position(double x, double z) const {
    const double half_width = dimensions_.width * 0.5;
    const double half_height = dimensions_.height * 0.5;
    const double clamped_x = std::clamp(x, -half_width, half_width);
    const double clamped_z = std::clamp(z, -half_height, half_height);

    const double undulation = std::sin(clamped_x * k_primary_frequency) * std::cos(clamped_z * k_primary_frequency);
    const double ridge = std::sin(clamped_x * k_ridge_frequency_x + clamped_z * k_ridge_frequency_z);
    return relief_ * (0.5 + 0.25 * undulation + 0.25 * ridge);
}

TerrainDimensions ProceduralTerrain::terrain_dimensions() const {
    return dimensions_;
}

RockField::RockField(const TerrainHeightProvider& terrain, std::size_t rock_count, RandomSource& random_source) {
    const TerrainDimensions dimensions = terrain.terrain_dimensions();
    const double spread_x = dimensions.width * 0.5 * k_rock_spread_fraction;
    const double spread_z = dimensions.height * 0.5 * k_rock_spread_fraction;

    list_rocks_.reserve(rock_count);
    for (std::size_t index = 0; index < rock_count; ++index) {
        TerrainObject rock{};
        rock.identifier = fmt::format("rock-{}", index + 1);
        rock.location = Vec2{random_source.uniform(-spread_x, spread_x), random_source.uniform(-spread_z, spread_z)};
        rock.size = random_source.uniform(k_rock_min_size, k_rock_max_size);
        list_rocks_.push_back(rock);
    }
    get_logger()->info("Scattered {} rocks across {}x{} terrain", list_rocks_.size(), dimensions.width, dimensions.height);
}

std::vector<TerrainObject> RockField::objects_within(const Vec2& center, double radius) const {
    std::vector<TerrainObject> nearby;
    for (const TerrainObject& rock : list_rocks_) {
        if (distance_xz(center, rock.location) <= radius) {
            nearby.push_back(rock);
        }
    }
    std::sort(nearby.begin(), nearby.end(), [&center](const TerrainObject& lhs, const TerrainObject& rhs) {
        return distance_xz(center, lhs.location) < distance_xz(center, rhs.location);
    });
    return nearby;
}

const std::vector<TerrainObject>& RockField::rocks() const noexcept {
    return list_rocks_;
}

}  // namespace rover_sim
