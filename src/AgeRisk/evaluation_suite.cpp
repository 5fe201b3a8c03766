#include "evaluation_suite.h"

#include "AgeRisk.Core/exception.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <tuple>

namespace agerisk {

namespace {
void check_series(const core::IncidenceSeries &predicted, const core::IncidenceSeries &observed) {
    if (predicted.empty() || observed.empty()) {
        throw core::InvalidInput(fmt::format("Can not evaluate empty series, {} predicted, {} observed.",
                                             predicted.size(), observed.size()));
    }
}

std::vector<double> predicted_at(const core::IncidenceSeries &predicted,
                                 const std::vector<double> &ages) {
    auto result = std::vector<double>{};
    result.reserve(ages.size());
    for (auto age : ages) {
        result.emplace_back(predicted.rate_at(age));
    }

    return result;
}

void check_cohort(const std::vector<SurvivalRecord> &cohort, const std::vector<double> &values) {
    if (cohort.size() != values.size()) {
        throw core::InvalidInput(fmt::format("Cohort and predictions size mismatch: {} vs {}.",
                                             cohort.size(), values.size()));
    }
}
} // namespace

EvaluationSuite::EvaluationSuite(EvaluationOptions options) : options_{std::move(options)} {
    if (!(options_.checkpoint_step > 0.0)) {
        throw core::InvalidParameter(
            fmt::format("Checkpoint step must be positive, given: {}", options_.checkpoint_step));
    }

    if (!(options_.rate_unit > 0.0)) {
        throw core::InvalidParameter(
            fmt::format("Rate unit must be positive, given: {}", options_.rate_unit));
    }

    std::sort(options_.checkpoints.begin(), options_.checkpoints.end());
}

const EvaluationOptions &EvaluationSuite::options() const noexcept { return options_; }

std::vector<double> EvaluationSuite::checkpoints(const core::IncidenceSeries &observed) const {
    if (!options_.checkpoints.empty() || observed.empty()) {
        return options_.checkpoints;
    }

    auto first = observed.ages().front();
    auto last = observed.ages().back();
    auto step = options_.checkpoint_step;

    // Checkpoints are computed from the index, a running sum drifts for fractional steps.
    const auto tolerance = 1e-9 * step;
    auto start = std::ceil(first / step - 1e-9) * step;
    auto result = std::vector<double>{};
    for (std::size_t i = 0;; i++) {
        auto age = start + static_cast<double>(i) * step;
        if (age > last + tolerance) {
            break;
        }

        result.emplace_back(std::min(age, last));
    }

    if (result.empty()) {
        result.emplace_back(last);
    }

    return result;
}

double EvaluationSuite::brier_score(const core::IncidenceSeries &predicted,
                                    const core::IncidenceSeries &observed) const {
    check_series(predicted, observed);
    auto ages = checkpoints(observed);
    auto sum = 0.0;
    for (auto age : ages) {
        auto error = (predicted.rate_at(age) - observed.rate_at(age)) / options_.rate_unit;
        sum += error * error;
    }

    return sum / static_cast<double>(ages.size());
}

double EvaluationSuite::time_auc(const core::IncidenceSeries &predicted,
                                 const core::IncidenceSeries &observed) const {
    check_series(predicted, observed);
    const auto &ages = observed.ages();
    const auto &rates = observed.rates();
    auto values = predicted_at(predicted, ages);

    auto sum = 0.0;
    auto count = 0;
    for (auto checkpoint : checkpoints(observed)) {
        auto concordance = 0.0;
        auto pairs = 0.0;
        for (std::size_t i = 0; i < ages.size() && ages[i] <= checkpoint; i++) {
            for (std::size_t j = i + 1; j < ages.size() && ages[j] <= checkpoint; j++) {
                if (rates[i] == rates[j]) {
                    continue;
                }

                auto high = rates[i] > rates[j] ? i : j;
                auto low = high == i ? j : i;
                pairs += 1.0;
                if (values[high] > values[low]) {
                    concordance += 1.0;
                } else if (values[high] == values[low]) {
                    concordance += 0.5;
                }
            }
        }

        if (pairs > 0.0) {
            sum += concordance / pairs;
            count++;
        }
    }

    return count > 0 ? sum / count : 0.5;
}

double EvaluationSuite::negative_log_likelihood(const core::IncidenceSeries &predicted,
                                                const core::IncidenceSeries &observed) const {
    check_series(predicted, observed);

    // Age zero rows are left out, point predictions are zero or unbounded at birth.
    auto values = std::vector<double>{};
    auto rates = std::vector<double>{};
    for (std::size_t i = 0; i < observed.size(); i++) {
        auto age = observed.ages()[i];
        if (age > 0.0) {
            values.emplace_back(predicted.rate_at(age));
            rates.emplace_back(observed.rates()[i]);
        }
    }

    if (rates.empty()) {
        throw core::InvalidInput("No observations past age zero to evaluate the likelihood on.");
    }

    switch (options_.family) {
    case LikelihoodFamily::poisson:
        return poisson_negative_log_likelihood(values, rates);
    case LikelihoodFamily::bernoulli: {
        for (auto &value : values) {
            value = std::min(value / options_.rate_unit, 1.0);
        }

        return bernoulli_negative_log_likelihood(values, rates, options_.rate_unit);
    }
    case LikelihoodFamily::gaussian:
        return gaussian_negative_log_likelihood(values, rates);
    default:
        throw core::InvalidParameter("Unknown likelihood family.");
    }
}

EvaluationResult EvaluationSuite::evaluate(const core::IncidenceSeries &predicted,
                                           const core::IncidenceSeries &observed,
                                           std::size_t parameter_count) const {
    auto result = EvaluationResult{};
    result.brier = brier_score(predicted, observed);
    result.time_auc = time_auc(predicted, observed);
    result.nll = negative_log_likelihood(predicted, observed);
    result.aic = aic(result.nll, parameter_count);
    return result;
}

double EvaluationSuite::aic(double nll, std::size_t parameter_count) noexcept {
    return 2.0 * static_cast<double>(parameter_count) + 2.0 * nll;
}

double EvaluationSuite::brier_score(const std::vector<SurvivalRecord> &cohort,
                                    const std::vector<double> &probability, double t) {
    check_cohort(cohort, probability);
    auto sum = 0.0;
    auto known = 0;
    for (std::size_t i = 0; i < cohort.size(); i++) {
        const auto &record = cohort[i];
        double outcome = 0.0;
        if (record.time <= t && record.event) {
            outcome = 1.0;
        } else if (record.time <= t) {
            continue;
        }

        auto error = probability[i] - outcome;
        sum += error * error;
        known++;
    }

    if (known == 0) {
        throw core::InvalidInput(fmt::format("No records with known status at age {}.", t));
    }

    return sum / known;
}

double EvaluationSuite::time_dependent_auc(const std::vector<SurvivalRecord> &cohort,
                                           const std::vector<double> &risk_scores, double t) {
    check_cohort(cohort, risk_scores);
    auto cases = std::vector<double>{};
    auto controls = std::vector<double>{};
    for (std::size_t i = 0; i < cohort.size(); i++) {
        if (cohort[i].time <= t && cohort[i].event) {
            cases.emplace_back(risk_scores[i]);
        } else if (cohort[i].time > t) {
            controls.emplace_back(risk_scores[i]);
        }
    }

    if (cases.empty() || controls.empty()) {
        throw core::InvalidInput(fmt::format(
            "No comparable pairs at age {}: {} cases, {} controls.", t, cases.size(),
            controls.size()));
    }

    auto concordance = 0.0;
    for (auto case_risk : cases) {
        for (auto control_risk : controls) {
            if (case_risk > control_risk) {
                concordance += 1.0;
            } else if (case_risk == control_risk) {
                concordance += 0.5;
            }
        }
    }

    return concordance / (static_cast<double>(cases.size()) * static_cast<double>(controls.size()));
}

std::vector<ModelEvaluation> EvaluationSuite::rank(std::vector<ModelEvaluation> evaluations) {
    std::stable_sort(evaluations.begin(), evaluations.end(), [](const auto &left, const auto &right) {
        return std::tie(left.result.aic, left.result.nll, left.name) <
               std::tie(right.result.aic, right.result.nll, right.name);
    });

    return evaluations;
}

} // namespace agerisk
