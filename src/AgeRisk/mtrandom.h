#pragma once

#include "randombit_generator.h"
#include <random>

namespace agerisk {

/// @brief Mersenne Twister random number generator algorithm
///
/// @details Always seeded explicitly, Monte Carlo runs must be reproducible.
class MTRandom32 final : public RandomBitGenerator {
  public:
    /// @brief Initialise a new instance of the MTRandom32 class
    /// @param seed The value to initialise the internal state
    explicit MTRandom32(const unsigned int seed);

    unsigned int operator()() override;

    double next_double() noexcept override;

  private:
    std::mt19937 engine_;
};
} // namespace agerisk
