#include "mutation_accumulation_model.h"
#include "mtrandom.h"
#include "random_algorithm.h"

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

// Tolerance absorbing products such as 0.1 * 30 evaluating to 2.9999...
constexpr double division_count_tolerance = 1e-9;

void check_ages(const std::vector<double> &ages) {
    for (auto age : ages) {
        if (!(age >= 0.0) || !std::isfinite(age)) {
            throw core::InvalidInput(fmt::format("Invalid age value: {}, must be non-negative.", age));
        }
    }
}

/// Binomial upper tail, P(X >= threshold) for X ~ Binomial(trials, p).
double binomial_upper_tail(double trials, double p, int threshold) {
    if (trials < threshold || p <= 0.0) {
        return 0.0;
    }

    if (p >= 1.0) {
        return 1.0;
    }

    if (threshold == 1) {
        return core::MathHelper::at_least_one(p, trials);
    }

    auto mean = trials * p;
    if (mean >= threshold) {
        // Bulk of the mass is past the threshold, sum the short lower tail instead.
        auto lower = 0.0;
        for (auto k = 0; k < threshold; k++) {
            lower += std::exp(core::MathHelper::log_binomial_pmf(k, trials, p));
        }

        return std::clamp(1.0 - lower, 0.0, 1.0);
    }

    auto sum = 0.0;
    for (auto k = static_cast<double>(threshold); k <= trials; k += 1.0) {
        auto term = std::exp(core::MathHelper::log_binomial_pmf(k, trials, p));
        sum += term;
        if (k > mean && term <= sum * core::MathHelper::machine_precision()) {
            break;
        }
    }

    return std::min(sum, 1.0);
}

/// Sum of the Poisson upper tail, P(X >= threshold) for X ~ Poisson(lambda).
double poisson_upper_tail(double lambda, int threshold) {
    if (lambda <= 0.0) {
        return 0.0;
    }

    if (threshold == 1) {
        return -std::expm1(-lambda);
    }

    auto log_lambda = std::log(lambda);
    auto sum = 0.0;
    for (auto k = threshold;; k++) {
        auto term = std::exp(k * log_lambda - lambda - std::lgamma(k + 1.0));
        sum += term;
        if (k > lambda && term <= sum * core::MathHelper::machine_precision()) {
            break;
        }
    }

    return std::min(sum, 1.0);
}
} // namespace

void validate(const ModelAParameters &parameters) {
    if (!(parameters.p > 0.0 && parameters.p < 1.0)) {
        throw core::InvalidParameter(
            fmt::format("Mutation probability must be in (0, 1), given: {}", parameters.p));
    }

    if (parameters.clones <= 0) {
        throw core::InvalidParameter(
            fmt::format("Number of clones must be positive, given: {}", parameters.clones));
    }

    if (!(parameters.divisions_per_year > 0.0) || !std::isfinite(parameters.divisions_per_year)) {
        throw core::InvalidParameter(fmt::format("Divisions per year must be positive, given: {}",
                                                 parameters.divisions_per_year));
    }

    if (!(parameters.repair_efficiency >= 0.0 && parameters.repair_efficiency <= 1.0)) {
        throw core::InvalidParameter(fmt::format("Repair efficiency must be in [0, 1], given: {}",
                                                 parameters.repair_efficiency));
    }

    if (parameters.clonal_threshold < 1) {
        throw core::InvalidParameter(fmt::format("Clonal threshold must be at least 1, given: {}",
                                                 parameters.clonal_threshold));
    }

    if (parameters.rate_distribution.has_value()) {
        const auto &rate = parameters.rate_distribution.value();
        if (!std::isfinite(rate.mu) || !(rate.sigma > 0.0) || !std::isfinite(rate.sigma)) {
            throw core::InvalidParameter(fmt::format(
                "Invalid log-normal rate distribution: mu={}, sigma={}", rate.mu, rate.sigma));
        }
    }
}

void validate(const MonteCarloOptions &options) {
    if (options.simulated_clones < 1 || options.block_size < 1) {
        throw core::InvalidParameter(
            fmt::format("Invalid simulation size: {} clones in blocks of {}.",
                        options.simulated_clones, options.block_size));
    }
}

double effective_probability(const ModelAParameters &parameters) noexcept {
    return parameters.p * (1.0 - parameters.repair_efficiency);
}

MutationAccumulationModel::MutationAccumulationModel(ModelAParameters parameters)
    : parameters_{std::move(parameters)} {
    validate(parameters_);
}

MutationAccumulationModel::MutationAccumulationModel(ModelAParameters parameters,
                                                     MonteCarloOptions options)
    : parameters_{std::move(parameters)}, mode_{EvaluationMode::monte_carlo}, options_{options} {
    validate(parameters_);
    validate(options_);
    simulate_clones();
}

EvaluationMode MutationAccumulationModel::mode() const noexcept { return mode_; }

const ModelAParameters &MutationAccumulationModel::parameters() const noexcept {
    return parameters_;
}

double MutationAccumulationModel::divisions_at(double age) const {
    if (!(age >= 0.0) || !std::isfinite(age)) {
        throw core::InvalidInput(fmt::format("Invalid age value: {}, must be non-negative.", age));
    }

    return std::floor(parameters_.divisions_per_year * age + division_count_tolerance);
}

double MutationAccumulationModel::clone_probability(double age) const {
    auto divisions = divisions_at(age);
    if (mode_ == EvaluationMode::monte_carlo) {
        return simulated_clone_probability(divisions);
    }

    return binomial_upper_tail(divisions, effective_probability(parameters_),
                               parameters_.clonal_threshold);
}

double MutationAccumulationModel::probability(double age) const {
    auto clone = clone_probability(age);
    return core::MathHelper::at_least_one(clone, static_cast<double>(parameters_.clones));
}

PredictionSequence MutationAccumulationModel::predict(std::vector<double> ages) const {
    check_ages(ages);
    return PredictionSequence{*this, std::move(ages)};
}

std::vector<double> MutationAccumulationModel::predict_scaled(const std::vector<double> &ages,
                                                              double scale_to_max) const {
    return predict_scaled(ages, scale_to_max, ages);
}

std::vector<double>
MutationAccumulationModel::predict_scaled(const std::vector<double> &ages, double scale_to_max,
                                          const std::vector<double> &reference_ages) const {
    auto scale = scale_factor(reference_ages, scale_to_max);
    auto result = predict(ages).to_vector();
    for (auto &value : result) {
        value *= scale;
    }

    return result;
}

double MutationAccumulationModel::scale_factor(const std::vector<double> &reference_ages,
                                               double scale_to_max) const {
    if (!(scale_to_max > 0.0) || !std::isfinite(scale_to_max)) {
        throw core::InvalidParameter(
            fmt::format("Scale maximum must be positive, given: {}", scale_to_max));
    }

    auto reference = predict(reference_ages).to_vector();
    if (reference.empty()) {
        return 1.0;
    }

    auto max_value = *std::max_element(reference.cbegin(), reference.cend());
    if (!(max_value > 0.0)) {
        throw core::InvalidInput("Can not rescale a prediction curve with zero maximum.");
    }

    return scale_to_max / max_value;
}

std::vector<double> MutationAccumulationModel::predict_poisson(
    const std::vector<double> &ages) const {
    check_ages(ages);
    auto p_eff = effective_probability(parameters_);
    auto result = std::vector<double>{};
    result.reserve(ages.size());
    for (auto age : ages) {
        auto lambda = divisions_at(age) * p_eff;
        auto clone = poisson_upper_tail(lambda, parameters_.clonal_threshold);
        result.emplace_back(
            core::MathHelper::at_least_one(clone, static_cast<double>(parameters_.clones)));
    }

    return result;
}

void MutationAccumulationModel::simulate_clones() {
    auto timer = core::ScopedTimer{"Monte Carlo clone simulation",
                                   options_.verbosity == core::VerboseMode::verbose};

    const auto total = options_.simulated_clones;
    const auto block_size = options_.block_size;
    const auto blocks = (total + block_size - 1) / block_size;
    const auto threshold = parameters_.clonal_threshold;
    const auto repair = 1.0 - parameters_.repair_efficiency;
    const auto fixed_p = effective_probability(parameters_);
    const auto &distribution = parameters_.rate_distribution;

    auto block_results = std::vector<std::vector<double>>(blocks);
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, blocks), [&](const auto &range) {
        for (auto block = range.begin(); block != range.end(); ++block) {
            auto engine = MTRandom32{options_.seed + static_cast<unsigned int>(block)};
            auto random = Random{engine};
            auto first = block * block_size;
            auto count = std::min(block_size, total - first);

            auto &divisions = block_results[block];
            divisions.reserve(count);
            for (std::size_t i = 0; i < count; i++) {
                auto p_eff = fixed_p;
                if (distribution.has_value()) {
                    auto p = random.next_lognormal(distribution->mu, distribution->sigma);
                    p_eff = std::min(p, 1.0) * repair;
                }

                if (p_eff <= 0.0) {
                    divisions.emplace_back(std::numeric_limits<double>::infinity());
                    continue;
                }

                auto total_divisions = 0.0;
                for (auto hit = 0; hit < threshold; hit++) {
                    total_divisions += random.next_geometric(p_eff);
                }

                divisions.emplace_back(total_divisions);
            }
        }
    });

    auto all_divisions = std::vector<double>{};
    all_divisions.reserve(total);
    for (const auto &block : block_results) {
        all_divisions.insert(all_divisions.end(), block.cbegin(), block.cend());
    }

    std::sort(all_divisions.begin(), all_divisions.end());
    threshold_divisions_ = std::make_shared<const std::vector<double>>(std::move(all_divisions));

    if (options_.verbosity == core::VerboseMode::verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Simulated {} clones in {} blocks, seed: {}.\n",
                   total, blocks, options_.seed);
    }
}

double MutationAccumulationModel::simulated_clone_probability(double divisions) const {
    const auto &simulated = *threshold_divisions_;
    auto malignant = std::upper_bound(simulated.cbegin(), simulated.cend(), divisions);
    return static_cast<double>(std::distance(simulated.cbegin(), malignant)) /
           static_cast<double>(simulated.size());
}

PredictionSequence::PredictionSequence(MutationAccumulationModel model, std::vector<double> ages)
    : model_{std::move(model)}, ages_{std::move(ages)} {}

std::vector<double> PredictionSequence::to_vector() const {
    return std::vector<double>(begin(), end());
}

} // namespace agerisk
