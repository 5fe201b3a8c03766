/**
 * @file
 * @brief This file contains functions for loading subsections of the main JSON file
 */
#pragma once
#include "configuration.h"

namespace agerisk::input {
/// @brief Check the schema version and throw if invalid
/// @param j The root JSON object
/// @throw ConfigurationError: If version attribute is not present or invalid
void check_version(const nlohmann::json &j);

/// @brief Load target and held-out incidence series
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load the series
void load_series_info(const nlohmann::json &j, Configuration &config);

/// @brief Load cross-tissue observations, optional section
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load tissue observations
void load_tissues_info(const nlohmann::json &j, Configuration &config);

/// @brief Load mutation accumulation model, grid and calibration sections
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load calibration info
void load_calibration_info(const nlohmann::json &j, Configuration &config);

/// @brief Load hazard regression section, optional
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load hazard info
void load_hazard_info(const nlohmann::json &j, Configuration &config);

/// @brief Load evaluation section, optional
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load evaluation info
void load_evaluation_info(const nlohmann::json &j, Configuration &config);
} // namespace agerisk::input
