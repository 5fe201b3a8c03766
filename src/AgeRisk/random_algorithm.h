#pragma once

#include "randombit_generator.h"
#include <functional>

namespace agerisk {
/// @brief General purpose random variates sampling algorithms
class Random {
  public:
    Random() = delete;
    /// @brief Initialise a new instance of the Random class
    /// @param generator Underline pseudo-random number engine instance
    Random(RandomBitGenerator &generator);

    /// @brief Generates a random floating point number in range [0,1)
    /// @return A floating point value in range [0,1).
    double next_double() noexcept;

    /// @brief Generates the next random number from a standard normal distribution
    /// @return The generated floating point random number
    double next_normal();

    /// @brief Generates the next random number from a normal distribution
    /// @param mean The mean parameter
    /// @param standard_deviation The standard deviation parameter
    /// @return The generated floating point random number
    double next_normal(double mean, double standard_deviation);

    /// @brief Generates the next random number from a log-normal distribution
    /// @param mu Mean of the underlying normal distribution
    /// @param sigma Standard deviation of the underlying normal distribution
    /// @return The generated positive random number
    double next_lognormal(double mu, double sigma);

    /// @brief Samples the number of Bernoulli trials up to and including the first success
    /// @param probability The success probability per trial, in (0, 1]
    /// @return The number of trials, at least one
    double next_geometric(double probability);

  private:
    std::reference_wrapper<RandomBitGenerator> engine_;
    double next_uniform_internal(double min_value, double max_value);
    double next_normal_internal(double mean, double standard_deviation);
};
} // namespace agerisk
