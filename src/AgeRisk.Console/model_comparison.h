#pragma once

#include "AgeRisk.Input/api.h"
#include "AgeRisk/api.h"

#include <optional>
#include <string>
#include <vector>

namespace agerisk {

/// @brief Tissue regression outcome, reported apart from the age series ranking
struct TissueReport {
    ReplicativeRiskFit fit;
    EvaluationResult result;
};

/// @brief Outcome of fitting and comparing all model families
struct ComparisonReport {
    /// @brief Mutation accumulation model grid search
    GridSearchResult calibration;

    /// @brief Fitted hazard curves, one per converged form
    std::vector<HazardFit> hazard_fits;

    /// @brief Hazard forms that failed to fit, with the failure message
    std::vector<std::pair<HazardForm, std::string>> hazard_failures;

    /// @brief Replicative risk regression, if tissues are configured
    std::optional<TissueReport> tissues;

    /// @brief Age series models ranked by AIC on the held-out series
    std::vector<ModelEvaluation> ranking;
};

/// @brief Calibrates and fits every configured model, then ranks them
/// @param config The application configuration
/// @return The comparison report
ComparisonReport run_comparison(const input::Configuration &config);

/// @brief Prints the comparison report to the console
/// @param report The comparison report
void print_report(const ComparisonReport &report);

} // namespace agerisk
