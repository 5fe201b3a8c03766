#include "hazard_model.h"
#include "likelihood.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk.Core/string_util.h"

#include <cmath>
#include <fmt/color.h>
#include <fmt/format.h>
#include <limits>
#include <utility>

namespace agerisk {

namespace {

struct SearchSpace {
    std::vector<double> lower;
    std::vector<double> upper;
    std::vector<double> step;
};

SearchSpace search_space(HazardForm form) {
    switch (form) {
    case HazardForm::power_law:
        return {.lower = {-60.0, -0.99}, .upper = {20.0, 20.0}, .step = {0.5, 0.1}};
    case HazardForm::exponential:
        return {.lower = {-60.0, -5.0}, .upper = {20.0, 5.0}, .step = {0.5, 0.01}};
    case HazardForm::weibull:
        return {.lower = {-10.0, -5.0}, .upper = {30.0, 5.0}, .step = {0.5, 0.1}};
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

HazardParameters to_parameters(HazardForm form, const std::vector<double> &x) {
    if (form == HazardForm::weibull) {
        return {std::exp(x[0]), std::exp(x[1])};
    }

    return {std::exp(x[0]), x[1]};
}

std::vector<double> to_search(HazardForm form, const HazardParameters &parameters) {
    if (form == HazardForm::weibull) {
        return {std::log(parameters[0]), std::log(parameters[1])};
    }

    return {std::log(parameters[0]), parameters[1]};
}

/// Ordinary least squares line through (x, y), std::nullopt without two distinct x.
std::optional<std::pair<double, double>> line_fit(const std::vector<double> &x,
                                                  const std::vector<double> &y) {
    if (x.size() < 2) {
        return std::nullopt;
    }

    auto n = static_cast<double>(x.size());
    auto mean_x = 0.0;
    auto mean_y = 0.0;
    for (std::size_t i = 0; i < x.size(); i++) {
        mean_x += x[i] / n;
        mean_y += y[i] / n;
    }

    auto sxx = 0.0;
    auto sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); i++) {
        sxx += (x[i] - mean_x) * (x[i] - mean_x);
        sxy += (x[i] - mean_x) * (y[i] - mean_y);
    }

    if (!(sxx > 0.0)) {
        return std::nullopt;
    }

    auto slope = sxy / sxx;
    return std::make_pair(mean_y - slope * mean_x, slope);
}

HazardParameters initial_guess(HazardForm form, const core::IncidenceSeries &series,
                               double rate_unit) {
    auto x = std::vector<double>{};
    auto y = std::vector<double>{};
    auto mean_hazard = 0.0;
    for (std::size_t i = 0; i < series.size(); i++) {
        auto age = series.ages()[i];
        auto rate = series.rates()[i];
        if (rate <= 0.0) {
            continue;
        }

        auto log_hazard = std::log(rate / rate_unit);
        mean_hazard += rate / rate_unit;
        if (form == HazardForm::exponential) {
            x.emplace_back(age);
            y.emplace_back(log_hazard);
        } else if (age > 0.0) {
            x.emplace_back(std::log(age));
            y.emplace_back(log_hazard);
        }
    }

    if (!y.empty()) {
        mean_hazard /= static_cast<double>(y.size());
    }

    auto line = line_fit(x, y);
    switch (form) {
    case HazardForm::power_law:
        if (line.has_value() && line->second > -0.9) {
            return {std::exp(line->first), line->second};
        }

        return {mean_hazard, 0.0};
    case HazardForm::exponential:
        if (line.has_value()) {
            return {std::exp(line->first), line->second};
        }

        return {mean_hazard, 0.0};
    case HazardForm::weibull:
        if (line.has_value() && line->second > -0.9) {
            // log h = log(k) - k log(lambda) + (k - 1) log(t)
            auto k = line->second + 1.0;
            return {std::exp((std::log(k) - line->first) / k), k};
        }

        return {1.0 / mean_hazard, 1.0};
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

void check_time(double t) {
    if (!(t >= 0.0)) {
        throw core::InvalidInput(fmt::format("Invalid hazard time: {}, must be non-negative.", t));
    }
}

/// Width of the first age bin, the smallest positive age or one year.
double birth_bin_width(const std::vector<double> &ages) {
    auto width = std::numeric_limits<double>::infinity();
    for (auto age : ages) {
        if (age > 0.0 && age < width) {
            width = age;
        }
    }

    return std::isfinite(width) ? width : 1.0;
}

/// Expected rates, age zero is read as the mean hazard over the first age bin.
std::vector<double> expected_rates(HazardForm form, const HazardParameters &parameters,
                                   const std::vector<double> &ages, double rate_unit) {
    auto result = std::vector<double>{};
    result.reserve(ages.size());
    for (auto age : ages) {
        if (age == 0.0) {
            auto width = birth_bin_width(ages);
            result.emplace_back(cumulative_hazard(form, parameters, width) / width * rate_unit);
        } else {
            result.emplace_back(hazard(form, parameters, age) * rate_unit);
        }
    }

    return result;
}
} // namespace

std::string to_string(HazardForm form) {
    switch (form) {
    case HazardForm::power_law:
        return "power_law";
    case HazardForm::exponential:
        return "exponential";
    case HazardForm::weibull:
        return "weibull";
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

HazardForm parse_hazard_form(std::string_view name) {
    for (auto form : {HazardForm::power_law, HazardForm::exponential, HazardForm::weibull}) {
        if (core::case_insensitive::equals(name, to_string(form))) {
            return form;
        }
    }

    throw core::InvalidParameter(fmt::format("Unknown hazard form: {}", name));
}

void validate(HazardForm form, const HazardParameters &parameters) {
    auto lambda = parameters[0];
    auto shape = parameters[1];
    if (!(lambda > 0.0) || !std::isfinite(lambda) || !std::isfinite(shape)) {
        throw core::InvalidParameter(
            fmt::format("Invalid {} parameters: {}, {}", to_string(form), lambda, shape));
    }

    if (form == HazardForm::power_law && !(shape > -1.0)) {
        throw core::InvalidParameter(fmt::format("Power law exponent must be > -1: {}", shape));
    }

    if (form == HazardForm::weibull && !(shape > 0.0)) {
        throw core::InvalidParameter(fmt::format("Weibull shape must be positive: {}", shape));
    }
}

double hazard(HazardForm form, const HazardParameters &parameters, double t) {
    check_time(t);
    auto lambda = parameters[0];
    auto shape = parameters[1];
    switch (form) {
    case HazardForm::power_law:
        return lambda * std::pow(t, shape);
    case HazardForm::exponential:
        return lambda * std::exp(shape * t);
    case HazardForm::weibull:
        return (shape / lambda) * std::pow(t / lambda, shape - 1.0);
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

double cumulative_hazard(HazardForm form, const HazardParameters &parameters, double t) {
    check_time(t);
    auto lambda = parameters[0];
    auto shape = parameters[1];
    switch (form) {
    case HazardForm::power_law:
        return lambda * std::pow(t, shape + 1.0) / (shape + 1.0);
    case HazardForm::exponential:
        if (std::abs(shape) < 1e-12) {
            return lambda * t;
        }

        return lambda * std::expm1(shape * t) / shape;
    case HazardForm::weibull:
        return std::pow(t / lambda, shape);
    default:
        throw core::InvalidParameter("Unknown hazard form.");
    }
}

double survival(HazardForm form, const HazardParameters &parameters, double t) {
    return std::exp(-cumulative_hazard(form, parameters, t));
}

double incidence(HazardForm form, const HazardParameters &parameters, double t) {
    return -std::expm1(-cumulative_hazard(form, parameters, t));
}

double HazardFit::hazard(double t) const { return agerisk::hazard(form, parameters, t); }

double HazardFit::cumulative_hazard(double t) const {
    return agerisk::cumulative_hazard(form, parameters, t);
}

double HazardFit::survival(double t) const { return agerisk::survival(form, parameters, t); }

double HazardFit::incidence(double t) const { return agerisk::incidence(form, parameters, t); }

std::vector<double> HazardFit::predict_rates(const std::vector<double> &ages) const {
    return expected_rates(form, parameters, ages, rate_unit);
}

HazardRegressionModel::HazardRegressionModel(HazardFitOptions options)
    : options_{std::move(options)} {
    if (!(options_.rate_unit > 0.0)) {
        throw core::InvalidParameter(
            fmt::format("Rate unit must be positive, given: {}", options_.rate_unit));
    }
}

const HazardFitOptions &HazardRegressionModel::options() const noexcept { return options_; }

HazardFit HazardRegressionModel::fit(HazardForm form, const core::IncidenceSeries &series) const {
    if (series.empty()) {
        throw core::InvalidInput("Can not fit a hazard to an empty incidence series.");
    }

    if (series.all_zero()) {
        throw core::FitDidNotConverge(
            fmt::format("Flat zero incidence series, {} hazard has no optimum.", to_string(form)));
    }

    const auto rate_unit = options_.rate_unit;
    auto objective = [&](const std::vector<double> &x) {
        auto expected = expected_rates(form, to_parameters(form, x), series.ages(), rate_unit);
        return poisson_negative_log_likelihood(expected, series.rates());
    };

    auto space = search_space(form);
    auto start = options_.initial_parameters.value_or(initial_guess(form, series, rate_unit));
    validate(form, start);

    auto optimizer = NelderMeadOptimizer{space.lower, space.upper, options_.optimizer};
    auto optimum = optimizer.minimize(objective, to_search(form, start), space.step);
    if (!optimum.converged || !std::isfinite(optimum.value)) {
        throw core::FitDidNotConverge(
            fmt::format("{} hazard fit did not converge after {} iterations.", to_string(form),
                        optimum.iterations));
    }

    for (std::size_t i = 0; i < optimum.point.size(); i++) {
        auto margin = 1e-6 * (space.upper[i] - space.lower[i]);
        if (optimum.point[i] <= space.lower[i] + margin ||
            optimum.point[i] >= space.upper[i] - margin) {
            throw core::FitDidNotConverge(fmt::format(
                "{} hazard optimum on the search boundary, parameter {}: {}", to_string(form), i,
                optimum.point[i]));
        }
    }

    auto result = HazardFit{.form = form,
                            .parameters = to_parameters(form, optimum.point),
                            .fitted_on = series,
                            .rate_unit = rate_unit,
                            .negative_log_likelihood = optimum.value,
                            .iterations = optimum.iterations};

    if (options_.verbosity == core::VerboseMode::verbose) {
        fmt::print(fg(fmt::color::cyan), "Hazard fit {:<12} lambda={:.6g}, shape={:.6g}, ",
                   to_string(form), result.parameters[0], result.parameters[1]);
        fmt::print("NLL={:.6g}, iterations={}\n", result.negative_log_likelihood,
                   result.iterations);
    }

    return result;
}

} // namespace agerisk
