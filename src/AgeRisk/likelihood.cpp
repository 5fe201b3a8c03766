#include "likelihood.h"

#include "AgeRisk.Core/exception.h"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <numbers>

namespace agerisk {

namespace {
void check_size(const std::vector<double> &predicted, const std::vector<double> &observed) {
    if (predicted.size() != observed.size()) {
        throw core::InvalidInput(fmt::format("Predicted and observed size mismatch: {} vs {}.",
                                             predicted.size(), observed.size()));
    }
}
} // namespace

double sum_squared_error(const std::vector<double> &predicted, const std::vector<double> &observed) {
    check_size(predicted, observed);
    auto sum = 0.0;
    for (std::size_t i = 0; i < predicted.size(); i++) {
        auto error = predicted[i] - observed[i];
        sum += error * error;
    }

    return sum;
}

double poisson_negative_log_likelihood(const std::vector<double> &expected,
                                       const std::vector<double> &observed) {
    check_size(expected, observed);
    auto sum = 0.0;
    for (std::size_t i = 0; i < expected.size(); i++) {
        auto mu = expected[i];
        auto y = observed[i];
        if (mu <= 0.0) {
            if (y > 0.0) {
                return std::numeric_limits<double>::infinity();
            }

            continue;
        }

        sum += mu - y * std::log(mu) + std::lgamma(y + 1.0);
    }

    return sum;
}

double bernoulli_negative_log_likelihood(const std::vector<double> &probability,
                                         const std::vector<double> &events, double population) {
    check_size(probability, events);
    if (!(population > 0.0)) {
        throw core::InvalidInput(fmt::format("Population must be positive, given: {}", population));
    }

    auto sum = 0.0;
    for (std::size_t i = 0; i < probability.size(); i++) {
        auto p = probability[i];
        auto y = events[i];
        if (y < 0.0 || y > population) {
            throw core::InvalidInput(
                fmt::format("Events outside of population: {} of {}.", y, population));
        }

        auto log_choose = std::lgamma(population + 1.0) - std::lgamma(y + 1.0) -
                          std::lgamma(population - y + 1.0);
        auto log_success = y > 0.0 ? y * std::log(p) : 0.0;
        auto log_failure = population - y > 0.0 ? (population - y) * std::log1p(-p) : 0.0;
        auto log_likelihood = log_choose + log_success + log_failure;
        if (std::isnan(log_likelihood) || std::isinf(log_likelihood)) {
            return std::numeric_limits<double>::infinity();
        }

        sum -= log_likelihood;
    }

    return sum;
}

double gaussian_negative_log_likelihood(const std::vector<double> &predicted,
                                        const std::vector<double> &observed) {
    check_size(predicted, observed);
    if (predicted.empty()) {
        throw core::InvalidInput("Can not compute likelihood of an empty series.");
    }

    auto n = static_cast<double>(predicted.size());
    auto variance = sum_squared_error(predicted, observed) / n;
    if (variance <= 0.0) {
        return -std::numeric_limits<double>::infinity();
    }

    return 0.5 * n * (std::log(2.0 * std::numbers::pi * variance) + 1.0);
}

} // namespace agerisk
