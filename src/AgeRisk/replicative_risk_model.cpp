#include "replicative_risk_model.h"

#include "AgeRisk.Core/exception.h"

#include <Eigen/Dense>
#include <cmath>
#include <fmt/format.h>
#include <iterator>
#include <set>

namespace agerisk {

double ReplicativeRiskFit::predict(double lscd, const std::string &group) const {
    if (!(lscd > 0.0)) {
        throw core::InvalidInput(
            fmt::format("Lifetime stem cell divisions must be positive, given: {}", lscd));
    }

    auto log_incidence = alpha + beta * std::log(lscd);
    if (auto effect = tissue_effects.find(group); effect != tissue_effects.end()) {
        log_incidence += effect->second;
    }

    return std::exp(log_incidence);
}

ReplicativeRiskModel::ReplicativeRiskModel(bool fixed_effects) : fixed_effects_{fixed_effects} {}

ReplicativeRiskFit
ReplicativeRiskModel::fit(const std::vector<core::TissueObservation> &observations) const {
    auto tissues = std::set<std::string>{};
    auto groups = std::set<std::string>{};
    for (const auto &entry : observations) {
        if (!(entry.lscd > 0.0) || !(entry.incidence > 0.0) || !std::isfinite(entry.lscd) ||
            !std::isfinite(entry.incidence)) {
            throw core::InvalidInput(
                fmt::format("Tissue {} values must be positive, LSCD: {}, incidence: {}",
                            entry.tissue_id, entry.lscd, entry.incidence));
        }

        if (!tissues.emplace(entry.tissue_id).second) {
            throw core::InvalidInput(fmt::format("Duplicated tissue: {}", entry.tissue_id));
        }

        groups.emplace(entry.group);
    }

    // The first group in lexicographic order is the reference level.
    auto effect_groups = std::vector<std::string>{};
    if (fixed_effects_ && groups.size() > 1) {
        effect_groups.assign(std::next(groups.begin()), groups.end());
    }

    auto rows = static_cast<Eigen::Index>(observations.size());
    auto cols = static_cast<Eigen::Index>(2 + effect_groups.size());
    if (rows < cols) {
        throw core::FitDidNotConverge(fmt::format(
            "Underdetermined regression: {} observations for {} coefficients.", rows, cols));
    }

    Eigen::MatrixXd design = Eigen::MatrixXd::Zero(rows, cols);
    Eigen::VectorXd response(rows);
    for (Eigen::Index i = 0; i < rows; i++) {
        const auto &entry = observations[static_cast<std::size_t>(i)];
        design(i, 0) = 1.0;
        design(i, 1) = std::log(entry.lscd);
        for (std::size_t g = 0; g < effect_groups.size(); g++) {
            if (entry.group == effect_groups[g]) {
                design(i, static_cast<Eigen::Index>(2 + g)) = 1.0;
            }
        }

        response(i) = std::log(entry.incidence);
    }

    auto solver = design.colPivHouseholderQr();
    if (solver.rank() < cols) {
        throw core::FitDidNotConverge(fmt::format(
            "Rank deficient regression design: rank {} for {} coefficients.", solver.rank(), cols));
    }

    Eigen::VectorXd coefficients = solver.solve(response);
    Eigen::VectorXd fitted = design * coefficients;
    Eigen::VectorXd residuals = response - fitted;

    auto result = ReplicativeRiskFit{.alpha = coefficients(0), .beta = coefficients(1)};
    result.parameter_count = static_cast<std::size_t>(cols);
    if (fixed_effects_ && groups.size() > 1) {
        result.tissue_effects.emplace(*groups.begin(), 0.0);
        for (std::size_t g = 0; g < effect_groups.size(); g++) {
            result.tissue_effects.emplace(effect_groups[g],
                                          coefficients(static_cast<Eigen::Index>(2 + g)));
        }
    }

    for (Eigen::Index i = 0; i < rows; i++) {
        result.tissue_ids.emplace_back(observations[static_cast<std::size_t>(i)].tissue_id);
        result.fitted.emplace_back(fitted(i));
        result.residuals.emplace_back(residuals(i));
    }

    auto ss_res = residuals.squaredNorm();
    auto ss_tot = (response.array() - response.mean()).matrix().squaredNorm();
    result.r_squared = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 1.0;

    auto dof = rows - cols;
    result.residual_standard_error = dof > 0 ? std::sqrt(ss_res / static_cast<double>(dof)) : 0.0;
    return result;
}

} // namespace agerisk
