#include "random_algorithm.h"

#include "AgeRisk.Core/exception.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace agerisk {
Random::Random(RandomBitGenerator &generator) : engine_{generator} {}

double Random::next_double() noexcept { return engine_.get().next_double(); }

double Random::next_normal() { return next_normal(0.0, 1.0); }

double Random::next_normal(double mean, double standard_deviation) {
    if (standard_deviation <= 0.0) {
        throw core::InvalidParameter(fmt::format(
            "The standard deviation parameter must be greater than zero: {}", standard_deviation));
    }

    return next_normal_internal(mean, standard_deviation);
}

double Random::next_lognormal(double mu, double sigma) {
    return std::exp(next_normal(mu, sigma));
}

double Random::next_geometric(double probability) {
    if (!(probability > 0.0) || probability > 1.0) {
        throw core::InvalidParameter(
            fmt::format("Geometric probability must be in (0, 1], given: {}", probability));
    }

    if (probability == 1.0) {
        return 1.0;
    }

    // Inversion with u in (0, 1], the log1p keeps precision for tiny probabilities.
    auto u = 1.0 - next_double();
    return std::max(1.0, std::ceil(std::log(u) / std::log1p(-probability)));
}

double Random::next_uniform_internal(double min_value, double max_value) {
    return min_value + (max_value - min_value) * next_double();
}

double Random::next_normal_internal(double mean, double standard_deviation) {
    double p, p1, p2;
    do {
        p1 = next_uniform_internal(-1.0, 1.0);
        p2 = next_uniform_internal(-1.0, 1.0);
        p = p1 * p1 + p2 * p2;
    } while (p >= 1.0 || p == 0.0);

    return mean + standard_deviation * p1 * std::sqrt(-2.0 * std::log(p) / p);
}
} // namespace agerisk
