#pragma once

#include <cstddef>
#include <vector>

namespace agerisk::core {

/// @brief Additional mathematical functions for probability calculations and
///        floating point comparison.
///
/// References:
/// - Didier H. Besset, Object-Oriented Implementation of Numerical Methods An
///   Introduction with Smalltalk, Morgan Kaufmann, November 2000.
///
/// - Martin Maechler, Accurately Computing log(1 - exp(-|a|)), Rmpfr package
///   vignette, 2012.
class MathHelper {
  public:
    MathHelper() = delete;

    /// @brief Gets the largest positive value which, when added to 1.0, yields 1.0.
    /// @return The machine precision value
    static double machine_precision() noexcept;

    /// @brief Gets the typical meaningful precision for numerical calculations.
    /// @return The default precision for numerical calculations
    static double default_numerical_precision() noexcept;

    /// @brief Compares two floating-point numbers for relative equality using
    ///        the default numerical precision.
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right) noexcept;

    /// @brief Compares two floating-point numbers for relative equality.
    ///
    /// Let <c>a</c> and <c>b</c> be the two numbers to be compared, the numbers are
    /// equal when <c>|a - b| / max(|a|, |b|)</c> is smaller than the precision, or
    /// when both magnitudes are below the precision.
    ///
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @param precision The comparison precision.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right, double precision) noexcept;

    /// @brief Computes <c>1 - (1 - p)^n</c> without cancellation for small p.
    /// @param p The per-trial probability, in [0, 1]
    /// @param n The number of independent trials
    /// @return The probability of at least one success
    static double at_least_one(double p, double n) noexcept;

    /// @brief Computes the natural logarithm of the binomial coefficient.
    /// @param n Number of trials
    /// @param k Number of successes, 0 <= k <= n
    /// @return log(n choose k)
    static double log_choose(double n, double k) noexcept;

    /// @brief Computes the binomial probability mass in log space.
    /// @param k Number of successes
    /// @param n Number of trials
    /// @param p Success probability per trial, in (0, 1)
    /// @return log P(X = k) for X ~ Binomial(n, p)
    static double log_binomial_pmf(double k, double n, double p) noexcept;
};

/// @brief Creates evenly spaced values over a closed interval
/// @param lower The first value
/// @param upper The last value
/// @param count Number of values
/// @return The spaced values, lower first
/// @throws InvalidParameter for empty count or inverted interval
std::vector<double> linear_space(double lower, double upper, std::size_t count);

/// @brief Creates values evenly spaced on a logarithmic scale over a closed interval
/// @param lower The first value, must be positive
/// @param upper The last value, must be greater or equal to lower
/// @param count Number of values
/// @return The spaced values, lower first
/// @throws InvalidParameter for empty count, non-positive bounds or inverted interval
std::vector<double> log_space(double lower, double upper, std::size_t count);

} // namespace agerisk::core
