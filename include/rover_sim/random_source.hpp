#pragma once

#include <cstdint>
#include <random>

namespace rover_sim {

/**
 * @brief Seedable uniform random draws shared by the behavior strategies.
 *
 * A seed of zero requests a nondeterministic seed from std::random_device.
 */
class RandomSource final {
  public:
    explicit RandomSource(std::uint32_t seed = 0);

    /** @brief Uniform draw in [@p low, @p high). */
    [[nodiscard]] double uniform(double low, double high);
    /** @brief True with probability @p probability. */
    [[nodiscard]] bool chance(double probability);

  private:
    std::mt19937 engine_;
};

}  // namespace rover_sim
