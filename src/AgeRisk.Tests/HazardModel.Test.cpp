#include "pch.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk/hazard_model.h"

#include <cmath>

using namespace agerisk;

namespace {
const auto all_forms =
    std::vector<HazardForm>{HazardForm::power_law, HazardForm::exponential, HazardForm::weibull};

HazardParameters example_parameters(HazardForm form) {
    switch (form) {
    case HazardForm::power_law:
        return {2e-10, 4.0};
    case HazardForm::exponential:
        return {1e-5, 0.08};
    case HazardForm::weibull:
        return {150.0, 5.0};
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

// Mean hazard over the first ten years, per 100,000
double fit_birth_rate(const HazardFit &fit) {
    return fit.cumulative_hazard(10.0) / 10.0 * 100000.0;
}

core::IncidenceSeries synthetic_series(HazardForm form, const HazardParameters &parameters) {
    auto ages = std::vector<double>{};
    auto rates = std::vector<double>{};
    for (auto age = 22.5; age < 90.0; age += 5.0) {
        ages.emplace_back(age);
        rates.emplace_back(hazard(form, parameters, age) * 100000.0);
    }

    return core::IncidenceSeries{ages, rates};
}
} // namespace

TEST(TestModel_Hazard, FormNames) {
    for (auto form : all_forms) {
        ASSERT_EQ(form, parse_hazard_form(to_string(form)));
    }

    ASSERT_EQ(HazardForm::weibull, parse_hazard_form("Weibull"));
    ASSERT_THROW(parse_hazard_form("gompertz"), core::InvalidParameter);
    ASSERT_EQ(2u, HazardRegressionModel::parameter_count(HazardForm::exponential));
}

TEST(TestModel_Hazard, SurvivalStartsAtOne) {
    for (auto form : all_forms) {
        auto parameters = example_parameters(form);
        ASSERT_EQ(1.0, survival(form, parameters, 0.0));
        ASSERT_EQ(0.0, incidence(form, parameters, 0.0));
        ASSERT_EQ(0.0, cumulative_hazard(form, parameters, 0.0));
    }
}

TEST(TestModel_Hazard, SurvivalNonIncreasing) {
    for (auto form : all_forms) {
        auto parameters = example_parameters(form);
        auto previous = 1.0;
        for (auto t = 0.0; t <= 100.0; t += 2.5) {
            auto value = survival(form, parameters, t);
            ASSERT_LE(value, previous);
            ASSERT_NEAR(1.0, value + incidence(form, parameters, t), 1e-12);
            previous = value;
        }
    }
}

TEST(TestModel_Hazard, CumulativeHazardMatchesIntegral) {
    for (auto form : all_forms) {
        auto parameters = example_parameters(form);

        // Trapezoidal integration of the hazard on a fine grid
        auto steps = 20000;
        auto upper = 80.0;
        auto width = upper / steps;
        auto integral = 0.0;
        for (auto i = 0; i < steps; i++) {
            auto left = hazard(form, parameters, i * width);
            auto right = hazard(form, parameters, (i + 1) * width);
            integral += 0.5 * (left + right) * width;
        }

        auto expected = cumulative_hazard(form, parameters, upper);
        ASSERT_NEAR(expected, integral, expected * 1e-6);
    }
}

TEST(TestModel_Hazard, ExponentialZeroGrowthLimit) {
    auto parameters = HazardParameters{1e-3, 0.0};
    ASSERT_DOUBLE_EQ(0.05, cumulative_hazard(HazardForm::exponential, parameters, 50.0));
}

TEST(TestModel_Hazard, InvalidParametersThrow) {
    ASSERT_THROW(validate(HazardForm::power_law, {0.0, 2.0}), core::InvalidParameter);
    ASSERT_THROW(validate(HazardForm::power_law, {1e-9, -1.0}), core::InvalidParameter);
    ASSERT_THROW(validate(HazardForm::weibull, {100.0, 0.0}), core::InvalidParameter);
    ASSERT_NO_THROW(validate(HazardForm::exponential, {1e-5, -0.1}));
    ASSERT_THROW(hazard(HazardForm::weibull, {100.0, 2.0}, -1.0), core::InvalidInput);
}

TEST(TestModel_Hazard, RecoversSyntheticParameters) {
    auto model = HazardRegressionModel{};
    for (auto form : all_forms) {
        auto truth = example_parameters(form);
        auto series = synthetic_series(form, truth);
        auto fit = model.fit(form, series);

        ASSERT_EQ(form, fit.form);
        ASSERT_NEAR(truth[0], fit.parameters[0], truth[0] * 1e-3);
        ASSERT_NEAR(truth[1], fit.parameters[1], std::abs(truth[1]) * 1e-3);
        ASSERT_EQ(series.size(), fit.fitted_on.size());
        ASSERT_LT(0, fit.iterations);

        auto rates = fit.predict_rates(series.ages());
        for (std::size_t i = 0; i < rates.size(); i++) {
            ASSERT_NEAR(series.rates()[i], rates[i], series.rates()[i] * 1e-2);
        }
    }
}

TEST(TestModel_Hazard, FitWithAgeZeroRow) {
    // Power law 1e-9 t^4 per person-year, one case per 100,000 at birth
    auto ages = std::vector<double>{0.0, 10.0, 20.0, 30.0, 40.0, 50.0, 60.0, 70.0, 80.0};
    auto rates = std::vector<double>{1.0};
    for (std::size_t i = 1; i < ages.size(); i++) {
        rates.emplace_back(1e-9 * std::pow(ages[i], 4.0) * 100000.0);
    }

    auto series = core::IncidenceSeries{ages, rates};
    auto model = HazardRegressionModel{};
    for (auto form : all_forms) {
        auto fit = model.fit(form, series);
        ASSERT_TRUE(std::isfinite(fit.negative_log_likelihood));

        auto predicted = fit.predict_rates(ages);
        ASSERT_TRUE(std::isfinite(predicted.front()));
        ASSERT_LT(0.0, predicted.front());
    }

    auto power_law = model.fit(HazardForm::power_law, series);
    ASSERT_NEAR(4.0, power_law.parameters[1], 0.02);
    ASSERT_NEAR(fit_birth_rate(power_law), power_law.predict_rates(ages).front(), 1e-12);

    auto weibull = model.fit(HazardForm::weibull, series);
    ASSERT_NEAR(5.0, weibull.parameters[1], 0.02);
}

TEST(TestModel_Hazard, FitFromExplicitStart) {
    auto truth = example_parameters(HazardForm::power_law);
    auto series = synthetic_series(HazardForm::power_law, truth);
    auto options = HazardFitOptions{};
    options.initial_parameters = HazardParameters{1e-9, 3.5};

    auto fit = HazardRegressionModel{options}.fit(HazardForm::power_law, series);
    ASSERT_NEAR(truth[1], fit.parameters[1], 1e-2);
}

TEST(TestModel_Hazard, FitOnZeroRatesDoesNotConverge) {
    auto zeros = core::IncidenceSeries{{20.0, 40.0, 60.0}, {0.0, 0.0, 0.0}};
    auto model = HazardRegressionModel{};
    for (auto form : all_forms) {
        ASSERT_THROW(model.fit(form, zeros), core::FitDidNotConverge);
    }
}

TEST(TestModel_Hazard, FitOnEmptySeriesThrows) {
    auto model = HazardRegressionModel{};
    ASSERT_THROW(model.fit(HazardForm::weibull, core::IncidenceSeries{}), core::InvalidInput);
}

TEST(TestModel_Hazard, InvalidRateUnitThrows) {
    auto options = HazardFitOptions{};
    options.rate_unit = 0.0;
    ASSERT_THROW(HazardRegressionModel{options}, core::InvalidParameter);
}

TEST(TestModel_Hazard, FittedCurveAccessors) {
    auto truth = example_parameters(HazardForm::weibull);
    auto fit = HazardFit{.form = HazardForm::weibull, .parameters = truth, .rate_unit = 100000.0};

    ASSERT_EQ(hazard(HazardForm::weibull, truth, 60.0), fit.hazard(60.0));
    ASSERT_EQ(survival(HazardForm::weibull, truth, 60.0), fit.survival(60.0));
    ASSERT_EQ(incidence(HazardForm::weibull, truth, 60.0), fit.incidence(60.0));
    ASSERT_EQ(cumulative_hazard(HazardForm::weibull, truth, 60.0), fit.cumulative_hazard(60.0));
    ASSERT_DOUBLE_EQ(fit.hazard(60.0) * 100000.0, fit.predict_rates({60.0}).front());
}
