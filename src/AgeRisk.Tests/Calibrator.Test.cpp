#include "pch.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk/calibrator.h"
#include "AgeRisk/mutation_accumulation_model.h"

#include <cmath>

using namespace agerisk;

namespace {
const auto target_ages = std::vector<double>{30.0, 40.0, 50.0, 60.0, 70.0, 80.0};

core::IncidenceSeries synthetic_target(double p) {
    auto parameters = ModelAParameters{};
    parameters.p = p;
    auto model = MutationAccumulationModel{parameters};
    return core::IncidenceSeries{target_ages, model.predict_scaled(target_ages, 450.0)};
}

GridDefinition p_grid() {
    auto grid = GridDefinition{};
    grid.p_values = {4e-9, 1e-9, 2e-9, 5e-10};
    return grid;
}
} // namespace

TEST(TestModel_Calibrator, GridSizeAndTraversal) {
    auto grid = GridDefinition{};
    grid.p_values = {2e-9, 1e-9};
    grid.clone_values = {1000, 500000, 10000};
    ASSERT_EQ(6u, grid.size());
    ASSERT_EQ(2u, grid.free_parameter_count());

    auto cells = grid.cells();
    ASSERT_EQ(6u, cells.size());

    // p is the slowest axis, each axis ascending
    ASSERT_EQ(1e-9, cells[0].p);
    ASSERT_EQ(1000, cells[0].clones);
    ASSERT_EQ(10000, cells[1].clones);
    ASSERT_EQ(500000, cells[2].clones);
    ASSERT_EQ(2e-9, cells[3].p);

    // Axes without values take the base parameters
    ASSERT_EQ(grid.base.divisions_per_year, cells[0].divisions_per_year);
    ASSERT_EQ(grid.base.clonal_threshold, cells[5].clonal_threshold);
}

TEST(TestModel_Calibrator, InvalidGridValueThrows) {
    auto grid = GridDefinition{};
    grid.p_values = {1e-9, 0.0};
    ASSERT_THROW(grid.cells(), core::InvalidParameter);

    auto calibrator = Calibrator{};
    ASSERT_THROW(calibrator.calibrate(grid, synthetic_target(2e-9)), core::InvalidParameter);
}

TEST(TestModel_Calibrator, RecoversGeneratingCell) {
    auto target = synthetic_target(2e-9);
    auto calibrator = Calibrator{};
    auto result = calibrator.calibrate(p_grid(), target);

    ASSERT_EQ(2e-9, result.best_parameters.p);
    ASSERT_NEAR(0.0, result.best_score, 1e-9);
    ASSERT_EQ(4u, result.search_trace.size());
    ASSERT_EQ(5e-10, result.search_trace.front().parameters.p);
    for (const auto &entry : result.search_trace) {
        ASSERT_LE(result.best_score, entry.score);
    }
}

TEST(TestModel_Calibrator, NegativeLogLikelihoodObjective) {
    auto target = synthetic_target(1e-9);
    auto calibrator = Calibrator{CalibrationOptions{.objective = ObjectiveKind::negative_log_likelihood}};
    auto result = calibrator.calibrate(p_grid(), target);

    ASSERT_EQ(1e-9, result.best_parameters.p);
    ASSERT_TRUE(std::isfinite(result.best_score));
}

TEST(TestModel_Calibrator, DeterministicResult) {
    auto target = synthetic_target(2e-9);
    auto calibrator = Calibrator{};
    auto first = calibrator.calibrate(p_grid(), target);
    auto second = calibrator.calibrate(p_grid(), target);

    ASSERT_EQ(first.best_parameters, second.best_parameters);
    ASSERT_EQ(first.best_score, second.best_score);
    ASSERT_EQ(first.search_trace.size(), second.search_trace.size());
    for (std::size_t i = 0; i < first.search_trace.size(); i++) {
        ASSERT_EQ(first.search_trace[i].parameters, second.search_trace[i].parameters);
        ASSERT_EQ(first.search_trace[i].score, second.search_trace[i].score);
    }
}

TEST(TestModel_Calibrator, TiesKeepFirstCell) {
    // Both rates complete the same number of divisions at every target age.
    auto grid = GridDefinition{};
    grid.divisions_per_year_values = {1.01, 1.0};
    auto target = core::IncidenceSeries{{10.0, 20.0, 40.0, 80.0}, {1.0, 5.0, 40.0, 300.0}};

    auto result = Calibrator{}.calibrate(grid, target);
    ASSERT_EQ(2u, result.search_trace.size());
    ASSERT_EQ(result.search_trace[0].score, result.search_trace[1].score);
    ASSERT_EQ(1.0, result.best_parameters.divisions_per_year);
}

TEST(TestModel_Calibrator, DegenerateTargetThrows) {
    auto calibrator = Calibrator{};
    ASSERT_THROW(calibrator.calibrate(p_grid(), core::IncidenceSeries{}), core::DegenerateTarget);

    auto zeros = core::IncidenceSeries{{40.0, 60.0, 80.0}, {0.0, 0.0, 0.0}};
    ASSERT_THROW(calibrator.calibrate(p_grid(), zeros), core::DegenerateTarget);
}

TEST(TestModel_Calibrator, FlatCellsScoreWorst) {
    auto target = synthetic_target(2e-9);
    auto calibrator = Calibrator{};

    auto flat = ModelAParameters{};
    flat.repair_efficiency = 1.0;
    ASSERT_TRUE(std::isinf(calibrator.score(flat, target)));

    auto grid = GridDefinition{};
    grid.repair_values = {1.0};
    ASSERT_THROW(calibrator.calibrate(grid, target), core::FitDidNotConverge);

    grid.repair_values = {0.0, 1.0};
    auto result = calibrator.calibrate(grid, target);
    ASSERT_EQ(0.0, result.best_parameters.repair_efficiency);
    ASSERT_TRUE(std::isinf(result.search_trace.back().score));
}

TEST(TestModel_Calibrator, InvalidTieToleranceThrows) {
    ASSERT_THROW(Calibrator(CalibrationOptions{.tie_tolerance = -1.0}), core::InvalidParameter);
}
