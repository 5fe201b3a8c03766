#pragma once

#include "mutation_model_types.h"

#include "AgeRisk.Core/forward_type.h"
#include "AgeRisk.Core/incidence_series.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace agerisk {

/// @brief Enumerates the calibration objective functions
enum class ObjectiveKind : uint8_t {
    /// @brief Sum of squared errors between scaled prediction and observed rates
    sum_squared_error,

    /// @brief Poisson negative log-likelihood of the observed rates
    negative_log_likelihood
};

/// @brief Defines the Cartesian search grid over the Model A parameters
///
/// @details Axes left empty keep the base parameter value. Each axis is searched
/// in ascending order, the first axis (p) varies slowest.
struct GridDefinition {
    /// @brief Values for the parameters not being searched
    ModelAParameters base{};

    /// @brief Per-division mutation probability axis
    std::vector<double> p_values{};

    /// @brief Repair efficiency axis
    std::vector<double> repair_values{};

    /// @brief Clonal threshold axis
    std::vector<int> threshold_values{};

    /// @brief Number of clones axis
    std::vector<long long> clone_values{};

    /// @brief Divisions per year axis
    std::vector<double> divisions_per_year_values{};

    /// @brief Gets the number of grid cells
    std::size_t size() const noexcept;

    /// @brief Gets the number of axes searched over more than one value
    std::size_t free_parameter_count() const noexcept;

    /// @brief Creates all grid cells in deterministic traversal order
    /// @return The parameters of each grid cell
    /// @throws core::InvalidParameter for axis values outside of the parameters domain
    std::vector<ModelAParameters> cells() const;
};

/// @brief Calibration run options
struct CalibrationOptions {
    /// @brief The objective function to minimise
    ObjectiveKind objective{ObjectiveKind::sum_squared_error};

    /// @brief Relative tolerance under which two scores are tied
    double tie_tolerance{1e-12};

    /// @brief Print calibration summary
    core::VerboseMode verbosity{core::VerboseMode::none};
};

/// @brief Single grid cell evaluation
struct GridSearchEntry {
    /// @brief The grid cell parameters
    ModelAParameters parameters{};

    /// @brief The objective score, infinity for unusable cells
    double score{};
};

/// @brief Defines the result of a calibration grid search
struct GridSearchResult {
    /// @brief The lowest scoring parameters
    ModelAParameters best_parameters{};

    /// @brief The lowest score
    double best_score{};

    /// @brief Every grid cell evaluation, in traversal order
    std::vector<GridSearchEntry> search_trace{};
};

/// @brief Implements the Model A grid search calibration against an incidence series
///
/// @details Grid cells are evaluated in parallel, each cell is independent. The
/// model curve is rescaled to the target maximum rate before scoring, so only
/// the curve shape is compared.
class Calibrator {
  public:
    /// @brief Initialises a new instance of the Calibrator class.
    /// @param options The calibration options
    explicit Calibrator(CalibrationOptions options = {});

    /// @brief Gets the calibration options
    const CalibrationOptions &options() const noexcept;

    /// @brief Scores a single parameter set against the target
    /// @param parameters The model parameters
    /// @param target The target incidence series
    /// @return The objective score, infinity if the model curve is flat zero
    double score(const ModelAParameters &parameters, const core::IncidenceSeries &target) const;

    /// @brief Searches the grid for the lowest scoring parameters
    /// @param grid The search grid definition
    /// @param target The target incidence series
    /// @return The calibration result, including the full search trace
    /// @throws core::DegenerateTarget for empty or all zero targets
    /// @throws core::InvalidParameter for invalid grid values
    /// @throws core::FitDidNotConverge if no grid cell produces a finite score
    GridSearchResult calibrate(const GridDefinition &grid,
                               const core::IncidenceSeries &target) const;

  private:
    CalibrationOptions options_;
};

} // namespace agerisk
