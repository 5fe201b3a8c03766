#pragma once

#include "AgeRisk.Core/tissue_observation.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agerisk {

/// @brief Defines the fitted replicative risk regression (Model B)
struct ReplicativeRiskFit {
    /// @brief Intercept on the log incidence scale
    double alpha{};

    /// @brief Slope of log incidence on log lifetime stem cell divisions
    double beta{};

    /// @brief Fixed effect per tissue group, relative to the reference group (zero)
    std::map<std::string, double> tissue_effects{};

    /// @brief The tissue identifiers, in input order
    std::vector<std::string> tissue_ids{};

    /// @brief Fitted log incidence per tissue, in input order
    std::vector<double> fitted{};

    /// @brief Observed minus fitted log incidence per tissue, in input order
    std::vector<double> residuals{};

    /// @brief Coefficient of determination on the log scale
    double r_squared{};

    /// @brief Residual standard error, zero for saturated designs
    double residual_standard_error{};

    /// @brief Number of regression coefficients
    std::size_t parameter_count{};

    /// @brief Predicts the incidence for a tissue
    /// @param lscd The tissue lifetime stem cell divisions, strictly positive
    /// @param group The tissue fixed effect group, empty or unknown for reference
    /// @return The predicted incidence
    /// @throws core::InvalidInput for non-positive divisions
    double predict(double lscd, const std::string &group = {}) const;
};

/// @brief Implements the cross-tissue log-linear replicative risk regression
///
/// @details Fits log(incidence) = alpha + beta log(LSCD) + tissue_effect by ordinary
/// least squares, tissue effects enter as dummy covariates per group.
class ReplicativeRiskModel {
  public:
    /// @brief Initialises a new instance of the ReplicativeRiskModel class.
    /// @param fixed_effects Whether to include tissue group fixed effects
    explicit ReplicativeRiskModel(bool fixed_effects = true);

    /// @brief Fits the regression to a set of tissue observations
    /// @param observations The tissue observations, one per tissue
    /// @return The fitted regression
    /// @throws core::InvalidInput for non-positive values or duplicated tissues
    /// @throws core::FitDidNotConverge for underdetermined designs
    ReplicativeRiskFit fit(const std::vector<core::TissueObservation> &observations) const;

  private:
    bool fixed_effects_;
};

} // namespace agerisk
