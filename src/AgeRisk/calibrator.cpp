#include "calibrator.h"
#include "likelihood.h"
#include "mutation_accumulation_model.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk.Core/math_util.h"
#include "AgeRisk.Core/scoped_timer.h"

#include <algorithm>
#include <cmath>
#include <fmt/color.h>
#include <fmt/format.h>
#include <limits>
#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

namespace agerisk {

namespace {
template <typename TYPE>
std::vector<TYPE> sorted_axis(const std::vector<TYPE> &values, TYPE base_value) {
    if (values.empty()) {
        return {base_value};
    }

    auto axis = values;
    std::sort(axis.begin(), axis.end());
    return axis;
}

template <typename TYPE> std::size_t axis_size(const std::vector<TYPE> &values) noexcept {
    return std::max<std::size_t>(1, values.size());
}
} // namespace

std::size_t GridDefinition::size() const noexcept {
    return axis_size(p_values) * axis_size(repair_values) * axis_size(threshold_values) *
           axis_size(clone_values) * axis_size(divisions_per_year_values);
}

std::size_t GridDefinition::free_parameter_count() const noexcept {
    auto count = std::size_t{0};
    for (auto axis : {axis_size(p_values), axis_size(repair_values), axis_size(threshold_values),
                      axis_size(clone_values), axis_size(divisions_per_year_values)}) {
        if (axis > 1) {
            count++;
        }
    }

    return count;
}

std::vector<ModelAParameters> GridDefinition::cells() const {
    auto p_axis = sorted_axis(p_values, base.p);
    auto repair_axis = sorted_axis(repair_values, base.repair_efficiency);
    auto threshold_axis = sorted_axis(threshold_values, base.clonal_threshold);
    auto clone_axis = sorted_axis(clone_values, base.clones);
    auto division_axis = sorted_axis(divisions_per_year_values, base.divisions_per_year);

    auto result = std::vector<ModelAParameters>{};
    result.reserve(size());
    for (auto p : p_axis) {
        for (auto repair : repair_axis) {
            for (auto threshold : threshold_axis) {
                for (auto clones : clone_axis) {
                    for (auto divisions : division_axis) {
                        auto cell = base;
                        cell.p = p;
                        cell.repair_efficiency = repair;
                        cell.clonal_threshold = threshold;
                        cell.clones = clones;
                        cell.divisions_per_year = divisions;
                        validate(cell);
                        result.emplace_back(std::move(cell));
                    }
                }
            }
        }
    }

    return result;
}

Calibrator::Calibrator(CalibrationOptions options) : options_{options} {
    if (!(options_.tie_tolerance >= 0.0)) {
        throw core::InvalidParameter(
            fmt::format("Tie tolerance must be non-negative, given: {}", options_.tie_tolerance));
    }
}

const CalibrationOptions &Calibrator::options() const noexcept { return options_; }

double Calibrator::score(const ModelAParameters &parameters,
                         const core::IncidenceSeries &target) const {
    auto model = MutationAccumulationModel{parameters};
    auto predicted = model.predict(target.ages()).to_vector();
    auto max_value = predicted.empty() ? 0.0 : *std::max_element(predicted.cbegin(), predicted.cend());
    if (!(max_value > 0.0)) {
        return std::numeric_limits<double>::infinity();
    }

    auto scale = target.max_rate();
    for (auto &value : predicted) {
        value = value / max_value * scale;
    }

    switch (options_.objective) {
    case ObjectiveKind::sum_squared_error:
        return sum_squared_error(predicted, target.rates());
    case ObjectiveKind::negative_log_likelihood:
        return poisson_negative_log_likelihood(predicted, target.rates());
    default:
        throw core::InvalidParameter("Unknown calibration objective.");
    }
}

GridSearchResult Calibrator::calibrate(const GridDefinition &grid,
                                       const core::IncidenceSeries &target) const {
    if (target.empty()) {
        throw core::DegenerateTarget("Calibration target series is empty.");
    }

    if (target.all_zero()) {
        throw core::DegenerateTarget("Calibration target series rates are all zero.");
    }

    auto verbose = options_.verbosity == core::VerboseMode::verbose;
    auto timer = core::ScopedTimer{"Model A grid search", verbose};

    auto cells = grid.cells();
    auto scores = std::vector<double>(cells.size());
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, cells.size()), [&](const auto &range) {
        for (auto i = range.begin(); i != range.end(); ++i) {
            scores[i] = score(cells[i], target);
        }
    });

    // Sequential reduction, ties keep the first cell in traversal order.
    auto best_index = cells.size();
    auto best_score = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < cells.size(); i++) {
        if (!std::isfinite(scores[i])) {
            continue;
        }

        if (best_index == cells.size() ||
            (scores[i] < best_score &&
             !core::MathHelper::equal(scores[i], best_score, options_.tie_tolerance))) {
            best_index = i;
            best_score = scores[i];
        }
    }

    if (best_index == cells.size()) {
        throw core::FitDidNotConverge(
            fmt::format("No grid cell out of {} produced a finite score.", cells.size()));
    }

    auto result = GridSearchResult{.best_parameters = cells[best_index], .best_score = best_score};
    result.search_trace.reserve(cells.size());
    for (std::size_t i = 0; i < cells.size(); i++) {
        result.search_trace.emplace_back(GridSearchEntry{.parameters = cells[i], .score = scores[i]});
    }

    if (verbose) {
        fmt::print(fg(fmt::color::cyan), "Grid search: {} cells, best score: {:.6g}\n",
                   cells.size(), best_score);
        const auto &best = result.best_parameters;
        fmt::print("  p={:.3e}, r={:.3f}, C={}, M={}, divisions/year={:.3f}\n", best.p,
                   best.repair_efficiency, best.clonal_threshold, best.clones,
                   best.divisions_per_year);
    }

    return result;
}

} // namespace agerisk
