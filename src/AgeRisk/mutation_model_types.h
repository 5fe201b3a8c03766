#pragma once

#include "AgeRisk.Core/forward_type.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace agerisk {

/// @brief Enumerates the mutation accumulation model evaluation modes
enum class EvaluationMode : uint8_t {
    /// @brief Closed form binomial probability
    analytic,

    /// @brief Seeded simulation of independent clones
    monte_carlo
};

/// @brief Log-normal distribution of the per-division mutation probability
struct LogNormalRate {
    /// @brief Mean of the underlying normal distribution, log scale
    double mu{};

    /// @brief Standard deviation of the underlying normal distribution, log scale
    double sigma{};

    bool operator==(const LogNormalRate &) const = default;
};

/// @brief Defines the mutation accumulation model (Model A) parameters
struct ModelAParameters {
    /// @brief Per-division driver mutation probability, in (0, 1)
    double p{2e-9};

    /// @brief Number of independent stem-cell clones (M)
    long long clones{500000};

    /// @brief Effective stem-cell divisions per year
    double divisions_per_year{2.5};

    /// @brief Per-clone mutation probability distribution, Monte Carlo mode only
    std::optional<LogNormalRate> rate_distribution{};

    /// @brief Fraction of mutations repaired before fixation (r), in [0, 1]
    double repair_efficiency{0.0};

    /// @brief Driver hits a clone must accumulate to become malignant (C)
    int clonal_threshold{1};

    bool operator==(const ModelAParameters &) const = default;
};

/// @brief Monte Carlo simulation options
struct MonteCarloOptions {
    /// @brief Master seed, clone block b is simulated with seed + b
    unsigned int seed{};

    /// @brief Number of simulated clones
    std::size_t simulated_clones{1000000};

    /// @brief Clones per parallel work block
    std::size_t block_size{10000};

    /// @brief Print simulation timing
    core::VerboseMode verbosity{core::VerboseMode::none};
};

/// @brief Validates the model parameters domain
/// @param parameters The parameters to validate
/// @throws core::InvalidParameter for values outside of the valid domain
void validate(const ModelAParameters &parameters);

/// @brief Validates the Monte Carlo simulation options
/// @param options The options to validate
/// @throws core::InvalidParameter for empty simulation sizes
void validate(const MonteCarloOptions &options);

/// @brief Computes the effective per-division mutation probability, p (1 - r)
/// @param parameters The model parameters
/// @return The effective probability
double effective_probability(const ModelAParameters &parameters) noexcept;

} // namespace agerisk
