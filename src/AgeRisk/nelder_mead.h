#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace agerisk {

/// @brief Nelder-Mead simplex coefficients and stopping criteria
struct NelderMeadOptions {
    /// @brief Maximum number of iterations
    int max_iterations{5000};

    /// @brief Convergence tolerance on the simplex function values spread, relative
    double tolerance_f{1e-10};

    /// @brief Convergence tolerance on the simplex vertices spread
    double tolerance_x{1e-8};

    /// @brief Reflection coefficient
    double alpha{1.0};

    /// @brief Expansion coefficient
    double gamma{2.0};

    /// @brief Contraction coefficient
    double rho{0.5};

    /// @brief Shrink coefficient
    double sigma{0.5};
};

/// @brief Result of a Nelder-Mead minimisation
struct NelderMeadResult {
    /// @brief The best point found
    std::vector<double> point{};

    /// @brief Objective value at the best point
    double value{};

    /// @brief Number of iterations performed
    int iterations{};

    /// @brief Whether the stopping tolerances were reached
    bool converged{};
};

/// @brief Bounded Nelder-Mead simplex minimiser
///
/// @details Derivative-free, every trial point is clamped to the bounds. Reaching
/// the iteration limit is reported as not converged, never retried.
class NelderMeadOptimizer {
  public:
    /// @brief The objective function type
    using Objective = std::function<double(const std::vector<double> &)>;

    /// @brief Initialises a new instance of the NelderMeadOptimizer class.
    /// @param lower The lower bound per dimension
    /// @param upper The upper bound per dimension
    /// @param options The optimizer options
    /// @throws core::InvalidParameter for inconsistent bounds
    NelderMeadOptimizer(std::vector<double> lower, std::vector<double> upper,
                        NelderMeadOptions options = {});

    /// @brief Gets the optimizer options
    const NelderMeadOptions &options() const noexcept;

    /// @brief Minimise the objective function
    /// @param objective Function to minimise
    /// @param start Initial guess
    /// @param step Initial simplex step per dimension
    /// @return The minimisation result
    /// @throws core::InvalidParameter for dimension mismatch
    NelderMeadResult minimize(const Objective &objective, const std::vector<double> &start,
                              const std::vector<double> &step) const;

  private:
    std::vector<double> lower_;
    std::vector<double> upper_;
    NelderMeadOptions options_;

    std::vector<double> clamp(std::vector<double> point) const;
};

} // namespace agerisk
