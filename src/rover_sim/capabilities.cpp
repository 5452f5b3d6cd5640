#include "rover_sim/capabilities.hpp"

#include <algorithm>
#include <cmath>

namespace rover_sim {

namespace {

double clamp_to(double value, const CapabilityRange& range) noexcept {
    if (!std::isfinite(value)) {
        return range.min;
    }
    return std::clamp(value, range.min, range.max);
}

}  // namespace

bool CapabilityPatch::empty() const noexcept {
    return !max_speed && !turn_rate && !sensor_range && !battery_capacity && !battery_level && !battery_drain_rate;
}

RoverCapabilities validate_capabilities(const RoverCapabilities& capabilities) noexcept {
    RoverCapabilities validated{};
    validated.max_speed = clamp_to(capabilities.max_speed, k_max_speed_range);
    validated.turn_rate = clamp_to(capabilities.turn_rate, k_turn_rate_range);
    validated.sensor_range = clamp_to(capabilities.sensor_range, k_sensor_range_range);
    validated.battery_capacity = clamp_to(capabilities.battery_capacity, k_battery_capacity_range);
    validated.battery_level = clamp_to(capabilities.battery_level, CapabilityRange{0.0, validated.battery_capacity});
    validated.battery_drain_rate = clamp_to(capabilities.battery_drain_rate, k_battery_drain_rate_range);
    return validated;
}

RoverCapabilities merge_capabilities(const RoverCapabilities& current, const CapabilityPatch& patch) noexcept {
    RoverCapabilities merged = current;
    merged.max_speed = patch.max_speed.value_or(current.max_speed);
    merged.turn_rate = patch.turn_rate.value_or(current.turn_rate);
    merged.sensor_range = patch.sensor_range.value_or(current.sensor_range);
    merged.battery_drain_rate = patch.battery_drain_rate.value_or(current.battery_drain_rate);

    if (patch.battery_capacity) {
        merged.battery_capacity = clamp_to(*patch.battery_capacity, k_battery_capacity_range);
        if (patch.battery_level) {
            merged.battery_level = *patch.battery_level;
        } else if (current.battery_capacity > 0.0) {
            const double charge_fraction = current.battery_level / current.battery_capacity;
            merged.battery_level = charge_fraction * merged.battery_capacity;
        }
    } else if (patch.battery_level) {
        merged.battery_level = *patch.battery_level;
    }

    return validate_capabilities(merged);
}

}  // namespace rover_sim
