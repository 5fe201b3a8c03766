#pragma once

#include <cstdint>
#include <vector>

namespace agerisk {

/// @brief Enumerates the likelihood families used to score predictions
enum class LikelihoodFamily : uint8_t {
    /// @brief Event counts per rate unit, Poisson distributed
    poisson,

    /// @brief Events out of the rate unit population, binomial distributed
    bernoulli,

    /// @brief Normally distributed residuals, variance at its maximum likelihood estimate
    gaussian
};

/// @brief Sum of squared errors between predicted and observed values
/// @param predicted The predicted values
/// @param observed The observed values, same size as predicted
/// @return The sum of squared errors
/// @throws core::InvalidInput for size mismatch
double sum_squared_error(const std::vector<double> &predicted, const std::vector<double> &observed);

/// @brief Poisson negative log-likelihood of observed counts given expected counts
///
/// Non-integer observations are supported through the gamma function.
/// @param expected The expected counts, non-negative
/// @param observed The observed counts, non-negative
/// @return The negative log-likelihood, infinity for impossible observations
/// @throws core::InvalidInput for size mismatch
double poisson_negative_log_likelihood(const std::vector<double> &expected,
                                       const std::vector<double> &observed);

/// @brief Binomial negative log-likelihood of observed events out of a fixed population
/// @param probability The predicted event probabilities, in [0, 1]
/// @param events The observed events per population
/// @param population The population size behind each observation
/// @return The negative log-likelihood, infinity for impossible observations
/// @throws core::InvalidInput for size mismatch or events outside [0, population]
double bernoulli_negative_log_likelihood(const std::vector<double> &probability,
                                         const std::vector<double> &events, double population);

/// @brief Gaussian negative log-likelihood with the variance profiled out
/// @param predicted The predicted values
/// @param observed The observed values
/// @return The negative log-likelihood at the maximum likelihood variance
/// @throws core::InvalidInput for size mismatch or empty values
double gaussian_negative_log_likelihood(const std::vector<double> &predicted,
                                        const std::vector<double> &observed);

} // namespace agerisk
