#include "math_util.h"
#include "exception.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>

namespace agerisk::core {

double MathHelper::machine_precision() noexcept { return std::numeric_limits<double>::epsilon(); }

double MathHelper::default_numerical_precision() noexcept {
    static const double precision = std::sqrt(machine_precision());
    return precision;
}

bool MathHelper::equal(double left, double right) noexcept {
    return equal(left, right, default_numerical_precision());
}

bool MathHelper::equal(double left, double right, double precision) noexcept {
    double norm = std::max(std::abs(left), std::abs(right));
    return norm < precision || std::abs(left - right) < precision * norm;
}

double MathHelper::at_least_one(double p, double n) noexcept {
    if (n <= 0.0 || p <= 0.0) {
        return 0.0;
    }

    if (p >= 1.0) {
        return 1.0;
    }

    return -std::expm1(n * std::log1p(-p));
}

double MathHelper::log_choose(double n, double k) noexcept {
    return std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
}

double MathHelper::log_binomial_pmf(double k, double n, double p) noexcept {
    return log_choose(n, k) + k * std::log(p) + (n - k) * std::log1p(-p);
}

std::vector<double> linear_space(double lower, double upper, std::size_t count) {
    if (count == 0 || lower > upper) {
        throw InvalidParameter(
            fmt::format("Invalid linear space: [{}, {}] with {} values", lower, upper, count));
    }

    auto result = std::vector<double>(count, lower);
    if (count == 1) {
        return result;
    }

    auto step = (upper - lower) / static_cast<double>(count - 1);
    for (std::size_t i = 1; i < count; i++) {
        result[i] = lower + step * static_cast<double>(i);
    }

    result.back() = upper;
    return result;
}

std::vector<double> log_space(double lower, double upper, std::size_t count) {
    if (lower <= 0.0) {
        throw InvalidParameter(fmt::format("Log space lower bound must be positive: {}", lower));
    }

    if (lower > upper) {
        throw InvalidParameter(fmt::format("Invalid log space: [{}, {}]", lower, upper));
    }

    auto exponents = linear_space(std::log10(lower), std::log10(upper), count);

    auto result = std::vector<double>{};
    result.reserve(count);
    for (auto exponent : exponents) {
        result.emplace_back(std::pow(10.0, exponent));
    }

    result.front() = lower;
    if (count > 1) {
        result.back() = upper;
    }

    return result;
}

} // namespace agerisk::core
