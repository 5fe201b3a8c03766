#pragma once

namespace agerisk {

/// @brief Random number generator algorithms interface
class RandomBitGenerator {
  public:
    /// @brief Destroys a RandomBitGenerator instance
    virtual ~RandomBitGenerator() = default;

    /// @brief Generates the next random number
    /// @return A pseudo-random 32 bit value
    virtual unsigned int operator()() = 0;

    /// @brief Generates a random floating point number in range [0,1)
    /// @return A floating point value in range [0,1).
    virtual double next_double() noexcept = 0;
};
} // namespace agerisk
