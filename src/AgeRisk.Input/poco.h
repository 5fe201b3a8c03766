#pragma once
#include "AgeRisk.Core/interval.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Data structures containing model parameters and configuration options
 *
 * POCO stands for "plain old class object". These structs represent data structures
 * which are contained in JSON-formatted configuration files.
 */
namespace agerisk::input::poco {
//! Incidence rate of an age group label for one calendar year
struct AgeGroupRateInfo {
    std::string age_group;
    int year{};
    double rate{};

    auto operator<=>(const AgeGroupRateInfo &rhs) const = default;
};

//! Incidence series, either by exact ages or by age group rows for one year
struct SeriesInfo {
    std::vector<double> ages;
    std::vector<double> rates;
    std::vector<int> years;
    std::vector<AgeGroupRateInfo> age_groups;
    std::optional<int> year;
    std::optional<agerisk::core::DoubleInterval> age_range;

    auto operator<=>(const SeriesInfo &rhs) const = default;
};

//! Lifetime tissue observation
struct TissueInfo {
    std::string tissue_id;
    double lscd{};
    double incidence{};
    std::string group;

    auto operator<=>(const TissueInfo &rhs) const = default;
};

//! Log-normal mutation rate distribution
struct LogNormalInfo {
    double mu{};
    double sigma{};

    auto operator<=>(const LogNormalInfo &rhs) const = default;
};

//! Mutation accumulation model parameters
struct ModelInfo {
    double p{2e-9};
    long long clones{500000};
    double divisions_per_year{2.5};
    double repair_efficiency{};
    int clonal_threshold{1};
    std::optional<LogNormalInfo> rate_distribution;

    auto operator<=>(const ModelInfo &rhs) const = default;
};

//! Calibration grid, each axis resolved to its values
struct GridInfo {
    std::vector<double> p;
    std::vector<double> repair_efficiency;
    std::vector<int> clonal_threshold;
    std::vector<long long> clones;
    std::vector<double> divisions_per_year;

    auto operator<=>(const GridInfo &rhs) const = default;
};

//! Calibration run settings
struct CalibrationInfo {
    std::string objective{"sse"};
    double tie_tolerance{1e-12};

    auto operator<=>(const CalibrationInfo &rhs) const = default;
};

//! Monte Carlo evaluation settings
struct MonteCarloInfo {
    unsigned int seed{};
    std::size_t simulated_clones{1000000};
    std::size_t block_size{10000};

    auto operator<=>(const MonteCarloInfo &rhs) const = default;
};

//! Hazard regression settings
struct HazardInfo {
    std::vector<std::string> forms{"power_law", "exponential", "weibull"};
    double rate_unit{100000.0};
    int max_iterations{5000};

    auto operator<=>(const HazardInfo &rhs) const = default;
};

//! Model evaluation settings
struct EvaluationInfo {
    std::vector<double> checkpoints;
    double checkpoint_step{10.0};
    double rate_unit{100000.0};
    std::string family{"poisson"};

    auto operator<=>(const EvaluationInfo &rhs) const = default;
};
} // namespace agerisk::input::poco
