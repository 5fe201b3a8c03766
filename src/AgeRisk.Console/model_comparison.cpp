#include "model_comparison.h"

#include "AgeRisk.Core/scoped_timer.h"

#include <fmt/color.h>

#include <cmath>

namespace agerisk {

namespace {
core::IncidenceSeries as_series(const core::IncidenceSeries &observed, std::vector<double> rates) {
    return core::IncidenceSeries{observed.ages(), std::move(rates)};
}

std::string mutation_model_name(const input::Configuration &config) {
    return config.monte_carlo.has_value() ? "mutation (monte carlo)" : "mutation (analytic)";
}

TissueReport fit_tissues(const input::Configuration &config) {
    auto model = ReplicativeRiskModel{config.fixed_effects};
    auto fit = model.fit(config.tissues);

    auto observed = std::vector<double>{};
    observed.reserve(config.tissues.size());
    for (const auto &tissue : config.tissues) {
        observed.emplace_back(std::log(tissue.incidence));
    }

    auto result = EvaluationResult{};
    result.nll = gaussian_negative_log_likelihood(fit.fitted, observed);
    result.aic = EvaluationSuite::aic(result.nll, fit.parameter_count);
    result.brier = std::nan("");
    result.time_auc = std::nan("");
    return TissueReport{.fit = std::move(fit), .result = result};
}
} // namespace

ComparisonReport run_comparison(const input::Configuration &config) {
    auto verbose = config.verbosity == core::VerboseMode::verbose;
    auto timer = core::ScopedTimer{"Model comparison", verbose};
    auto report = ComparisonReport{};
    auto suite = EvaluationSuite{config.evaluation};
    const auto &holdout = config.holdout;

    // Model A, calibrated on the target and held at the target peak scale
    fmt::print(fg(fmt::color::cyan), "\nCalibrating mutation accumulation model ...\n");
    auto calibrator = Calibrator{config.calibration};
    report.calibration = calibrator.calibrate(config.grid, config.target);

    auto mutation_model =
        config.monte_carlo.has_value()
            ? MutationAccumulationModel{report.calibration.best_parameters,
                                        config.monte_carlo.value()}
            : MutationAccumulationModel{report.calibration.best_parameters};
    auto mutation_rates = mutation_model.predict_scaled(
        holdout.ages(), config.target.max_rate(), config.target.ages());

    // The peak scale is estimated alongside the searched axes.
    auto mutation_parameters = config.grid.free_parameter_count() + 1;
    report.ranking.emplace_back(ModelEvaluation{
        .name = mutation_model_name(config),
        .parameter_count = mutation_parameters,
        .result = suite.evaluate(as_series(holdout, std::move(mutation_rates)), holdout,
                                 mutation_parameters),
    });

    // Model C, one fit per hazard form
    fmt::print(fg(fmt::color::cyan), "Fitting {} hazard forms ...\n", config.hazard_forms.size());
    auto hazard_model = HazardRegressionModel{config.hazard};
    for (auto form : config.hazard_forms) {
        try {
            auto fit = hazard_model.fit(form, config.target);
            auto parameters = HazardRegressionModel::parameter_count(form);
            report.ranking.emplace_back(ModelEvaluation{
                .name = fmt::format("hazard {}", to_string(form)),
                .parameter_count = parameters,
                .result = suite.evaluate(as_series(holdout, fit.predict_rates(holdout.ages())),
                                         holdout, parameters),
            });
            report.hazard_fits.emplace_back(std::move(fit));
        } catch (const core::FitDidNotConverge &ex) {
            fmt::print(fg(fmt::color::red), "Hazard {} fit failed: {}\n", to_string(form),
                       ex.what());
            report.hazard_failures.emplace_back(form, ex.what());
        }
    }

    // Model B, cross-tissue regression
    if (!config.tissues.empty()) {
        fmt::print(fg(fmt::color::cyan), "Fitting replicative risk regression on {} tissues ...\n",
                   config.tissues.size());
        report.tissues = fit_tissues(config);
    }

    report.ranking = EvaluationSuite::rank(std::move(report.ranking));
    return report;
}

void print_report(const ComparisonReport &report) {
    const auto &best = report.calibration.best_parameters;
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "\nMutation accumulation model\n");
    fmt::print("  p={:.3e}, repair={:.3f}, threshold={}, clones={}, divisions/year={:.3f}\n",
               best.p, best.repair_efficiency, best.clonal_threshold, best.clones,
               best.divisions_per_year);
    fmt::print("  best score={:.6g} over {} cells\n", report.calibration.best_score,
               report.calibration.search_trace.size());

    if (!report.hazard_fits.empty()) {
        fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "\nHazard regression\n");
        for (const auto &fit : report.hazard_fits) {
            fmt::print("  {:<12} lambda={:.6g}, shape={:.6g}, NLL={:.6g}, iterations={}\n",
                       to_string(fit.form), fit.parameters[0], fit.parameters[1],
                       fit.negative_log_likelihood, fit.iterations);
        }
    }

    for (const auto &[form, message] : report.hazard_failures) {
        fmt::print(fg(fmt::color::red), "  {:<12} not converged: {}\n", to_string(form), message);
    }

    if (report.tissues.has_value()) {
        const auto &tissues = report.tissues.value();
        fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "\nReplicative risk regression\n");
        fmt::print("  alpha={:.4f}, beta={:.4f}, r2={:.4f}, rse={:.4f}\n", tissues.fit.alpha,
                   tissues.fit.beta, tissues.fit.r_squared, tissues.fit.residual_standard_error);
        for (const auto &[group, effect] : tissues.fit.tissue_effects) {
            fmt::print("  group {:<16} {:+.4f}\n", group, effect);
        }

        fmt::print("  NLL={:.6g}, AIC={:.6g}\n", tissues.result.nll, tissues.result.aic);
    }

    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "\nHeld-out ranking by AIC\n");
    fmt::print("  {:<4} {:<24} {:>3} {:>12} {:>8} {:>14} {:>14}\n", "#", "model", "k", "brier",
               "auc", "nll", "aic");
    auto position = 1;
    for (const auto &entry : report.ranking) {
        fmt::print("  {:<4} {:<24} {:>3} {:>12.4e} {:>8.4f} {:>14.6g} {:>14.6g}\n", position++,
                   entry.name, entry.parameter_count, entry.result.brier, entry.result.time_auc,
                   entry.result.nll, entry.result.aic);
    }
}

} // namespace agerisk
