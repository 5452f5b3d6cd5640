#include "rover_sim/random_source.hpp"

namespace rover_sim {

namespace {
std::uint32_t resolve_seed(std::uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device device;
    return device();
}
}  // namespace

RandomSource::RandomSource(std::uint32_t seed)
    : engine_(resolve_seed(seed)) {}

double RandomSource::uniform(double low, double high) {
    if (high <= low) {
        return low;
    }
    std::uniform_real_distribution<double> distribution(low, high);
    return distribution(engine_);
}

bool RandomSource::chance(double probability) {
    return uniform(0.0, 1.0) < probability;
}

}  // namespace rover_sim
