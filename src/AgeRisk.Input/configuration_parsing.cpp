#include "configuration_parsing.h"
#include "configuration_parsing_helpers.h"
#include "jsonparser.h"

#include <fmt/color.h>
#include <stdexcept>

namespace agerisk::input {
using json = nlohmann::json;

nlohmann::json get(const json &j, const std::string &key) {
    try {
        return j.at(key);
    } catch (const std::exception &) {
        fmt::print(fmt::fg(fmt::color::red), "Missing key \"{}\"\n", key);
        throw ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }
}

void check_version(const json &j) {
    int version;
    if (!get_to(j, "version", version)) {
        throw ConfigurationError{"File must have a schema version"};
    }

    if (version != 1) {
        throw ConfigurationError{
            fmt::format("Configuration schema version: {} mismatch, supported: 1", version)};
    }
}

void load_series_info(const json &j, Configuration &config) {
    poco::SeriesInfo target;
    if (!get_to(j, "target", target)) {
        throw ConfigurationError{"Could not load target series"};
    }

    config.target = create_incidence_series(target);
    fmt::print("Target series: {} ages.\n", config.target.size());

    poco::SeriesInfo holdout;
    if (!j.contains("holdout")) {
        config.holdout = config.target;
        return;
    }

    if (!get_to(j, "holdout", holdout)) {
        throw ConfigurationError{"Could not load held-out series"};
    }

    config.holdout = create_incidence_series(holdout);
    fmt::print("Held-out series: {} ages.\n", config.holdout.size());
}

void load_tissues_info(const json &j, Configuration &config) {
    if (!j.contains("tissues")) {
        return;
    }

    const auto tissues = get(j, "tissues");
    bool success = true;
    std::vector<poco::TissueInfo> observations;
    get_to(tissues, "observations", observations, success);
    get_optional_to(tissues, "fixed_effects", config.fixed_effects, success);
    if (!success) {
        throw ConfigurationError{"Could not load tissue observations"};
    }

    config.tissues.clear();
    for (const auto &item : observations) {
        config.tissues.emplace_back(core::TissueObservation{
            .tissue_id = item.tissue_id,
            .lscd = item.lscd,
            .incidence = item.incidence,
            .group = item.group,
        });
    }

    fmt::print("Tissue observations: {}.\n", config.tissues.size());
}

void load_calibration_info(const json &j, Configuration &config) {
    const auto &calibration = get(j, "calibration");
    bool success = true;

    poco::ModelInfo model;
    poco::GridInfo grid;
    poco::CalibrationInfo options;
    std::optional<poco::MonteCarloInfo> monte_carlo;
    get_to(calibration, "model", model, success);
    get_to(calibration, "grid", grid, success);
    get_optional_to(calibration, "options", options, success);
    get_optional_to(calibration, "monte_carlo", monte_carlo, success);
    if (!success) {
        throw ConfigurationError{"Could not load calibration info"};
    }

    config.grid = GridDefinition{
        .base = create_model_parameters(model),
        .p_values = grid.p,
        .repair_values = grid.repair_efficiency,
        .threshold_values = grid.clonal_threshold,
        .clone_values = grid.clones,
        .divisions_per_year_values = grid.divisions_per_year,
    };

    config.calibration.objective =
        parse_option<ObjectiveKind>("calibration objective", options.objective,
                                    {{"sse", ObjectiveKind::sum_squared_error},
                                     {"nll", ObjectiveKind::negative_log_likelihood}});
    config.calibration.tie_tolerance = options.tie_tolerance;
    config.calibration.verbosity = config.verbosity;

    if (monte_carlo.has_value()) {
        config.monte_carlo = MonteCarloOptions{
            .seed = monte_carlo->seed,
            .simulated_clones = monte_carlo->simulated_clones,
            .block_size = monte_carlo->block_size,
            .verbosity = config.verbosity,
        };
    }

    fmt::print("Calibration grid: {} cells.\n", config.grid.size());
}

void load_hazard_info(const json &j, Configuration &config) {
    poco::HazardInfo info;
    bool success = true;
    if (!get_optional_to(j, "hazard", info, success)) {
        throw ConfigurationError{"Could not load hazard info"};
    }

    config.hazard_forms.clear();
    for (const auto &name : info.forms) {
        try {
            config.hazard_forms.emplace_back(parse_hazard_form(name));
        } catch (const core::InvalidParameter &) {
            fmt::print(fg(fmt::color::red), "Unknown hazard form: {}\n", name);
            throw ConfigurationError{fmt::format("Unknown hazard form: {}", name)};
        }
    }

    config.hazard.rate_unit = info.rate_unit;
    config.hazard.optimizer.max_iterations = info.max_iterations;
    config.hazard.verbosity = config.verbosity;
}

void load_evaluation_info(const json &j, Configuration &config) {
    poco::EvaluationInfo info;
    bool success = true;
    if (!get_optional_to(j, "evaluation", info, success)) {
        throw ConfigurationError{"Could not load evaluation info"};
    }

    config.evaluation.checkpoints = info.checkpoints;
    config.evaluation.checkpoint_step = info.checkpoint_step;
    config.evaluation.rate_unit = info.rate_unit;
    config.evaluation.family =
        parse_option<LikelihoodFamily>("likelihood family", info.family,
                                       {{"poisson", LikelihoodFamily::poisson},
                                        {"bernoulli", LikelihoodFamily::bernoulli},
                                        {"gaussian", LikelihoodFamily::gaussian}});
}
} // namespace agerisk::input
