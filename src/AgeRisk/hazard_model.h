#pragma once

#include "nelder_mead.h"

#include "AgeRisk.Core/forward_type.h"
#include "AgeRisk.Core/incidence_series.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agerisk {

/// @brief Enumerates the parametric hazard families (Model C)
enum class HazardForm : uint8_t {
    /// @brief h(t) = lambda t^k, parameters {lambda, k}, k > -1
    power_law,

    /// @brief h(t) = lambda exp(beta t), parameters {lambda, beta}
    exponential,

    /// @brief h(t) = (k / lambda) (t / lambda)^(k - 1), parameters {lambda, k}
    weibull
};

/// @brief Gets the hazard family name
/// @param form The hazard family
/// @return The family name
std::string to_string(HazardForm form);

/// @brief Parses a hazard family name, case-insensitive
/// @param name The family name, e.g. "weibull"
/// @return The hazard family
/// @throws core::InvalidParameter for unknown names
HazardForm parse_hazard_form(std::string_view name);

/// @brief Hazard family parameters, scale (lambda) first
using HazardParameters = std::array<double, 2>;

/// @brief Computes the hazard function h(t)
double hazard(HazardForm form, const HazardParameters &parameters, double t);

/// @brief Computes the cumulative hazard H(t), closed form per family
double cumulative_hazard(HazardForm form, const HazardParameters &parameters, double t);

/// @brief Computes the survival function S(t) = exp(-H(t))
double survival(HazardForm form, const HazardParameters &parameters, double t);

/// @brief Computes the cumulative incidence I(t) = 1 - S(t)
double incidence(HazardForm form, const HazardParameters &parameters, double t);

/// @brief Validates hazard family parameters domain
/// @throws core::InvalidParameter for values outside of the family domain
void validate(HazardForm form, const HazardParameters &parameters);

/// @brief Hazard fitting options
struct HazardFitOptions {
    /// @brief Population unit of the input rates, hazard = rate / rate_unit
    double rate_unit{100000.0};

    /// @brief The simplex optimizer options
    NelderMeadOptions optimizer{};

    /// @brief Caller supplied start parameters, e.g. when retrying a failed fit
    std::optional<HazardParameters> initial_parameters{};

    /// @brief Print fit summary
    core::VerboseMode verbosity{core::VerboseMode::none};
};

/// @brief Defines a fitted hazard function
struct HazardFit {
    /// @brief The hazard family
    HazardForm form{};

    /// @brief The fitted parameters, scale (lambda) first
    HazardParameters parameters{};

    /// @brief The series the hazard was fitted on
    core::IncidenceSeries fitted_on{};

    /// @brief Population unit of the fitted series rates
    double rate_unit{};

    /// @brief Poisson negative log-likelihood at the optimum
    double negative_log_likelihood{};

    /// @brief Number of optimizer iterations
    int iterations{};

    /// @brief Hazard at age t
    double hazard(double t) const;

    /// @brief Cumulative hazard at age t
    double cumulative_hazard(double t) const;

    /// @brief Survival probability at age t
    double survival(double t) const;

    /// @brief Cumulative incidence at age t
    double incidence(double t) const;

    /// @brief Predicts rates on the fitted series scale (per rate unit)
    ///
    /// Age zero is read as the mean hazard over the first age bin, H(w) / w with w
    /// the smallest positive age given, or one year. The point hazard there is zero
    /// or unbounded for most power law and Weibull shapes.
    /// @param ages The ages in years
    /// @return The predicted rates
    std::vector<double> predict_rates(const std::vector<double> &ages) const;
};

/// @brief Implements the parametric hazard regression of incidence series (Model C)
///
/// @details Rates are read as events per rate unit person-years, the fit minimises
/// the Poisson negative log-likelihood over log-transformed parameters, starting
/// from a closed-form log-linear regression. Expected rates follow
/// HazardFit::predict_rates, so an age zero row is scored on the first age bin.
/// Ranking the families is left to the caller.
class HazardRegressionModel {
  public:
    /// @brief Initialises a new instance of the HazardRegressionModel class.
    /// @param options The fitting options
    explicit HazardRegressionModel(HazardFitOptions options = {});

    /// @brief Gets the fitting options
    const HazardFitOptions &options() const noexcept;

    /// @brief Fits a hazard family to an incidence series
    /// @param form The hazard family
    /// @param series The incidence series
    /// @return The fitted hazard
    /// @throws core::InvalidInput for empty series
    /// @throws core::FitDidNotConverge for degenerate series or optimizer failure
    HazardFit fit(HazardForm form, const core::IncidenceSeries &series) const;

    /// @brief Gets the number of free parameters of a hazard family
    static constexpr std::size_t parameter_count(HazardForm) noexcept { return 2; }

  private:
    HazardFitOptions options_;
};

} // namespace agerisk
