#include "pch.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk/evaluation_suite.h"
#include "AgeRisk/likelihood.h"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace agerisk;
using agerisk::core::IncidenceSeries;

namespace {
const auto observed_ages =
    std::vector<double>{22.5, 32.5, 42.5, 52.5, 62.5, 72.5, 82.5, 87.5};
const auto observed_rates =
    std::vector<double>{2.0, 8.0, 30.0, 90.0, 200.0, 350.0, 480.0, 520.0};

IncidenceSeries observed() { return IncidenceSeries{observed_ages, observed_rates}; }

IncidenceSeries shifted(double offset) {
    auto rates = observed_rates;
    for (auto &value : rates) {
        value += offset;
    }

    return IncidenceSeries{observed_ages, rates};
}

std::vector<SurvivalRecord> cohort() {
    return {{.time = 50.0, .event = true},
            {.time = 60.0, .event = true},
            {.time = 70.0, .event = false},
            {.time = 80.0, .event = false},
            {.time = 55.0, .event = false}};
}
} // namespace

TEST(TestEvaluation_Suite, DefaultCheckpoints) {
    auto suite = EvaluationSuite{};
    auto checkpoints = suite.checkpoints(observed());
    ASSERT_EQ((std::vector<double>{30.0, 40.0, 50.0, 60.0, 70.0, 80.0}), checkpoints);

    auto custom = EvaluationSuite{EvaluationOptions{.checkpoints = {60.0, 40.0}}};
    ASSERT_EQ((std::vector<double>{40.0, 60.0}), custom.checkpoints(observed()));

    auto short_series = IncidenceSeries{{41.0, 44.0}, {1.0, 2.0}};
    ASSERT_EQ((std::vector<double>{44.0}), suite.checkpoints(short_series));
}

TEST(TestEvaluation_Suite, FractionalCheckpointStep) {
    auto suite = EvaluationSuite{EvaluationOptions{.checkpoint_step = 0.1}};
    auto series = IncidenceSeries{{0.0, 0.15, 0.3}, {1.0, 2.0, 3.0}};
    auto checkpoints = suite.checkpoints(series);

    ASSERT_EQ(4u, checkpoints.size());
    ASSERT_DOUBLE_EQ(0.0, checkpoints[0]);
    ASSERT_DOUBLE_EQ(0.1, checkpoints[1]);
    ASSERT_DOUBLE_EQ(0.2, checkpoints[2]);
    ASSERT_EQ(0.3, checkpoints[3]);
}

TEST(TestEvaluation_Suite, BrierScore) {
    auto suite = EvaluationSuite{};
    ASSERT_EQ(0.0, suite.brier_score(observed(), observed()));

    // Every checkpoint is 100 per 100,000 above the observation.
    ASSERT_NEAR(1e-6, suite.brier_score(shifted(100.0), observed()), 1e-15);
}

TEST(TestEvaluation_Suite, TimeDependentConcordance) {
    auto suite = EvaluationSuite{};
    ASSERT_DOUBLE_EQ(1.0, suite.time_auc(shifted(10.0), observed()));

    auto reversed_rates = observed_rates;
    std::reverse(reversed_rates.begin(), reversed_rates.end());
    ASSERT_DOUBLE_EQ(0.0, suite.time_auc(IncidenceSeries{observed_ages, reversed_rates}, observed()));

    // Tied predictions count half
    auto flat = IncidenceSeries{observed_ages, std::vector<double>(observed_ages.size(), 50.0)};
    ASSERT_DOUBLE_EQ(0.5, suite.time_auc(flat, observed()));
}

TEST(TestEvaluation_Suite, TimeDependentConcordanceNoPairs) {
    auto suite = EvaluationSuite{};
    auto constant = IncidenceSeries{{30.0, 40.0, 50.0}, {10.0, 10.0, 10.0}};
    ASSERT_EQ(0.5, suite.time_auc(shifted(1.0), constant));
}

TEST(TestEvaluation_Suite, NegativeLogLikelihoodFamilies) {
    auto prediction = shifted(5.0);

    auto poisson = EvaluationSuite{};
    ASSERT_DOUBLE_EQ(poisson_negative_log_likelihood(prediction.rates(), observed_rates),
                     poisson.negative_log_likelihood(prediction, observed()));

    auto gaussian = EvaluationSuite{EvaluationOptions{.family = LikelihoodFamily::gaussian}};
    ASSERT_DOUBLE_EQ(gaussian_negative_log_likelihood(prediction.rates(), observed_rates),
                     gaussian.negative_log_likelihood(prediction, observed()));

    auto bernoulli = EvaluationSuite{EvaluationOptions{.family = LikelihoodFamily::bernoulli}};
    auto value = bernoulli.negative_log_likelihood(prediction, observed());
    ASSERT_TRUE(std::isfinite(value));
    ASSERT_LT(0.0, value);
}

TEST(TestEvaluation_Suite, LikelihoodSkipsAgeZero) {
    // Curves such as the mutation model are exactly zero at birth
    auto ages = std::vector<double>{0.0, 10.0, 20.0, 30.0};
    auto observed_series = IncidenceSeries{ages, {1.0, 4.0, 9.0, 20.0}};
    auto predicted_series = IncidenceSeries{ages, {0.0, 5.0, 10.0, 18.0}};

    auto suite = EvaluationSuite{};
    auto nll = suite.negative_log_likelihood(predicted_series, observed_series);
    ASSERT_TRUE(std::isfinite(nll));
    ASSERT_DOUBLE_EQ(poisson_negative_log_likelihood({5.0, 10.0, 18.0}, {4.0, 9.0, 20.0}), nll);

    auto result = suite.evaluate(predicted_series, observed_series, 2);
    ASSERT_TRUE(std::isfinite(result.aic));

    auto birth_only = IncidenceSeries{{0.0}, {1.0}};
    ASSERT_THROW(suite.negative_log_likelihood(birth_only, birth_only), core::InvalidInput);
}

TEST(TestEvaluation_Suite, EvaluateCombinesMetrics) {
    auto suite = EvaluationSuite{};
    auto prediction = shifted(5.0);
    auto result = suite.evaluate(prediction, observed(), 2);

    ASSERT_EQ(suite.brier_score(prediction, observed()), result.brier);
    ASSERT_EQ(suite.time_auc(prediction, observed()), result.time_auc);
    ASSERT_EQ(suite.negative_log_likelihood(prediction, observed()), result.nll);
    ASSERT_DOUBLE_EQ(4.0 + 2.0 * result.nll, result.aic);
    ASSERT_LE(0.0, result.brier);
    ASSERT_GE(1.0, result.time_auc);

    ASSERT_THROW(suite.evaluate(IncidenceSeries{}, observed(), 2), core::InvalidInput);
}

TEST(TestEvaluation_Suite, FewerParametersRankFirst) {
    auto suite = EvaluationSuite{};
    auto prediction = shifted(5.0);

    auto evaluations = std::vector<ModelEvaluation>{
        {.name = "complex", .parameter_count = 5, .result = suite.evaluate(prediction, observed(), 5)},
        {.name = "simple", .parameter_count = 2, .result = suite.evaluate(prediction, observed(), 2)},
    };

    auto ranked = EvaluationSuite::rank(evaluations);
    ASSERT_EQ("simple", ranked.front().name);
    ASSERT_LT(ranked.front().result.aic, ranked.back().result.aic);
}

TEST(TestEvaluation_Suite, RankTieBreaks) {
    auto evaluations = std::vector<ModelEvaluation>{
        {.name = "b", .parameter_count = 2, .result = {.nll = 10.0, .aic = 24.0}},
        {.name = "c", .parameter_count = 1, .result = {.nll = 11.0, .aic = 24.0}},
        {.name = "a", .parameter_count = 2, .result = {.nll = 10.0, .aic = 24.0}},
        {.name = "d", .parameter_count = 2, .result = {.nll = 5.0, .aic = 14.0}},
    };

    auto ranked = EvaluationSuite::rank(evaluations);
    ASSERT_EQ("d", ranked[0].name);
    ASSERT_EQ("a", ranked[1].name);
    ASSERT_EQ("b", ranked[2].name);
    ASSERT_EQ("c", ranked[3].name);
}

TEST(TestEvaluation_Suite, InvalidOptionsThrow) {
    ASSERT_THROW(EvaluationSuite(EvaluationOptions{.checkpoint_step = 0.0}), core::InvalidParameter);
    ASSERT_THROW(EvaluationSuite(EvaluationOptions{.rate_unit = -1.0}), core::InvalidParameter);
}

TEST(TestEvaluation_Cohort, BrierScore) {
    auto probability = std::vector<double>{0.9, 0.4, 0.5, 0.4, 0.8};
    ASSERT_NEAR(0.195, EvaluationSuite::brier_score(cohort(), probability, 65.0), 1e-12);

    ASSERT_THROW(EvaluationSuite::brier_score(cohort(), {0.1}, 65.0), core::InvalidInput);
    auto censored = std::vector<SurvivalRecord>{{.time = 10.0, .event = false}};
    ASSERT_THROW(EvaluationSuite::brier_score(censored, {0.1}, 65.0), core::InvalidInput);
}

TEST(TestEvaluation_Cohort, TimeDependentAuc) {
    auto risk = std::vector<double>{0.9, 0.4, 0.5, 0.4, 0.8};
    ASSERT_DOUBLE_EQ(0.625, EvaluationSuite::time_dependent_auc(cohort(), risk, 65.0));

    // Before the first event there are no cases
    ASSERT_THROW(EvaluationSuite::time_dependent_auc(cohort(), risk, 40.0), core::InvalidInput);
}

TEST(TestLikelihood, SumSquaredError) {
    ASSERT_EQ(5.0, sum_squared_error({1.0, 2.0}, {2.0, 4.0}));
    ASSERT_THROW(sum_squared_error({1.0}, {1.0, 2.0}), core::InvalidInput);
}

TEST(TestLikelihood, PoissonZeroExpectation) {
    ASSERT_EQ(0.0, poisson_negative_log_likelihood({0.0}, {0.0}));
    ASSERT_TRUE(std::isinf(poisson_negative_log_likelihood({0.0}, {3.0})));
    ASSERT_NEAR(1.0, poisson_negative_log_likelihood({1.0}, {1.0}), 1e-12);
}

TEST(TestLikelihood, GaussianProfiledVariance) {
    // Residuals of +-1, maximum likelihood variance of one
    auto value = gaussian_negative_log_likelihood({0.0, 0.0}, {1.0, -1.0});
    ASSERT_NEAR(std::log(2.0 * 3.14159265358979323846) + 1.0, value, 1e-12);
    ASSERT_THROW(gaussian_negative_log_likelihood({}, {}), core::InvalidInput);
}

TEST(TestLikelihood, BernoulliPerPopulation) {
    // One event in ten, probability one tenth
    auto expected = -(std::log(10.0) + std::log(0.1) + 9.0 * std::log(0.9));
    ASSERT_NEAR(expected, bernoulli_negative_log_likelihood({0.1}, {1.0}, 10.0), 1e-9);
    ASSERT_THROW(bernoulli_negative_log_likelihood({0.1}, {11.0}, 10.0), core::InvalidInput);
    ASSERT_THROW(bernoulli_negative_log_likelihood({0.1}, {1.0}, 0.0), core::InvalidInput);
}
