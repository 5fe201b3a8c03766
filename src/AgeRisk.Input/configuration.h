/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load JSON-formatted
 * configuration files from disk.
 */
#pragma once

#include "poco.h"
#include "version.h"

#include "AgeRisk.Core/api.h"
#include "AgeRisk/calibrator.h"
#include "AgeRisk/evaluation_suite.h"
#include "AgeRisk/hazard_model.h"
#include "AgeRisk/mutation_model_types.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <vector>

namespace agerisk::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief Empirical incidence series used for calibration and fitting
    core::IncidenceSeries target;

    /// @brief Held-out incidence series used for evaluation, the target if not given
    core::IncidenceSeries holdout;

    /// @brief Cross-tissue observations for the replicative risk regression
    std::vector<core::TissueObservation> tissues;

    /// @brief Whether the tissue regression includes group fixed effects
    bool fixed_effects{true};

    /// @brief Mutation accumulation model calibration grid
    GridDefinition grid;

    /// @brief Calibration run options
    CalibrationOptions calibration;

    /// @brief Monte Carlo evaluation of the calibrated model, optional
    std::optional<MonteCarloOptions> monte_carlo;

    /// @brief Hazard forms to fit
    std::vector<HazardForm> hazard_forms;

    /// @brief Hazard fit options
    HazardFitOptions hazard;

    /// @brief Evaluation options
    EvaluationOptions evaluation;

    /// @brief Application logging verbosity mode
    core::VerboseMode verbosity{};

    /// @brief Application name
    const char *app_name = PROJECT_NAME;

    /// @brief Application version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Represents an error that occurred with the format of a config file
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param verbose Set log verbosity for the models
/// @return The configuration file information
/// @throw ConfigurationError: Invalid configuration file
Configuration get_configuration(const std::filesystem::path &config_file, bool verbose);

/// @brief Creates the configuration from a parsed JSON document
/// @param opt The root JSON object
/// @param verbose Set log verbosity for the models
/// @return The configuration information
/// @throw ConfigurationError: Invalid configuration content
Configuration get_configuration(const nlohmann::json &opt, bool verbose);

/// @brief Creates an incidence series from its configuration section
/// @param info The series information
/// @return The incidence series, restricted to the optional age range
/// @throw ConfigurationError: Invalid series values
core::IncidenceSeries create_incidence_series(const poco::SeriesInfo &info);

/// @brief Creates the mutation accumulation model parameters
/// @param info The model information
/// @return The model parameters
ModelAParameters create_model_parameters(const poco::ModelInfo &info);

} // namespace agerisk::input
