#include "nelder_mead.h"

#include "AgeRisk.Core/exception.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <numeric>

namespace agerisk {

namespace {
double safe_value(double value) noexcept {
    return std::isnan(value) ? std::numeric_limits<double>::infinity() : value;
}

std::vector<double> move_towards(const std::vector<double> &from, const std::vector<double> &to,
                                 double coefficient) {
    auto result = from;
    for (std::size_t i = 0; i < result.size(); i++) {
        result[i] = from[i] + coefficient * (to[i] - from[i]);
    }

    return result;
}
} // namespace

NelderMeadOptimizer::NelderMeadOptimizer(std::vector<double> lower, std::vector<double> upper,
                                         NelderMeadOptions options)
    : lower_{std::move(lower)}, upper_{std::move(upper)}, options_{options} {
    if (lower_.empty() || lower_.size() != upper_.size()) {
        throw core::InvalidParameter(fmt::format("Invalid optimizer bounds size: {} vs {}.",
                                                 lower_.size(), upper_.size()));
    }

    for (std::size_t i = 0; i < lower_.size(); i++) {
        if (!(lower_[i] < upper_[i])) {
            throw core::InvalidParameter(
                fmt::format("Invalid optimizer bounds: [{}, {}]", lower_[i], upper_[i]));
        }
    }

    if (options_.max_iterations < 1) {
        throw core::InvalidParameter(
            fmt::format("Invalid maximum iterations: {}", options_.max_iterations));
    }
}

const NelderMeadOptions &NelderMeadOptimizer::options() const noexcept { return options_; }

std::vector<double> NelderMeadOptimizer::clamp(std::vector<double> point) const {
    for (std::size_t i = 0; i < point.size(); i++) {
        point[i] = std::clamp(point[i], lower_[i], upper_[i]);
    }

    return point;
}

NelderMeadResult NelderMeadOptimizer::minimize(const Objective &objective,
                                               const std::vector<double> &start,
                                               const std::vector<double> &step) const {
    const auto dimension = lower_.size();
    if (start.size() != dimension || step.size() != dimension) {
        throw core::InvalidParameter(
            fmt::format("Optimizer dimension mismatch: {} start, {} step, {} bounds.", start.size(),
                        step.size(), dimension));
    }

    // Simplex of dimension + 1 vertices, start plus one step along each axis.
    auto vertices = std::vector<std::vector<double>>{clamp(start)};
    for (std::size_t i = 0; i < dimension; i++) {
        auto vertex = start;
        vertex[i] += step[i];
        vertex = clamp(std::move(vertex));
        if (vertex == vertices.front()) {
            vertex[i] = std::clamp(start[i] - step[i], lower_[i], upper_[i]);
        }

        vertices.emplace_back(std::move(vertex));
    }

    auto values = std::vector<double>{};
    for (const auto &vertex : vertices) {
        values.emplace_back(safe_value(objective(vertex)));
    }

    auto order = std::vector<std::size_t>(vertices.size());
    auto sort_simplex = [&]() {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](auto left, auto right) { return values[left] < values[right]; });
        auto sorted_vertices = std::vector<std::vector<double>>{};
        auto sorted_values = std::vector<double>{};
        for (auto index : order) {
            sorted_vertices.emplace_back(vertices[index]);
            sorted_values.emplace_back(values[index]);
        }

        vertices.swap(sorted_vertices);
        values.swap(sorted_values);
    };

    sort_simplex();

    auto result = NelderMeadResult{};
    const auto worst = dimension;
    for (int iteration = 0; iteration < options_.max_iterations; iteration++) {
        result.iterations = iteration + 1;

        auto f_span = std::abs(values[worst] - values[0]);
        auto x_span = 0.0;
        for (std::size_t v = 1; v < vertices.size(); v++) {
            for (std::size_t i = 0; i < dimension; i++) {
                x_span = std::max(x_span, std::abs(vertices[v][i] - vertices[0][i]));
            }
        }

        if (std::isfinite(values[0]) && f_span <= options_.tolerance_f * (1.0 + std::abs(values[0])) &&
            x_span <= options_.tolerance_x) {
            result.converged = true;
            break;
        }

        // Centroid of all but the worst vertex
        auto centroid = std::vector<double>(dimension, 0.0);
        for (std::size_t v = 0; v < worst; v++) {
            for (std::size_t i = 0; i < dimension; i++) {
                centroid[i] += vertices[v][i] / static_cast<double>(worst);
            }
        }

        auto reflected = clamp(move_towards(centroid, vertices[worst], -options_.alpha));
        auto f_reflected = safe_value(objective(reflected));

        if (f_reflected < values[0]) {
            auto expanded = clamp(move_towards(centroid, reflected, options_.gamma));
            auto f_expanded = safe_value(objective(expanded));
            if (f_expanded < f_reflected) {
                vertices[worst] = std::move(expanded);
                values[worst] = f_expanded;
            } else {
                vertices[worst] = std::move(reflected);
                values[worst] = f_reflected;
            }
        } else if (f_reflected < values[worst - 1]) {
            vertices[worst] = std::move(reflected);
            values[worst] = f_reflected;
        } else {
            auto contracted = f_reflected < values[worst]
                                  ? clamp(move_towards(centroid, reflected, options_.rho))
                                  : clamp(move_towards(centroid, vertices[worst], options_.rho));
            auto f_contracted = safe_value(objective(contracted));
            if (f_contracted < std::min(f_reflected, values[worst])) {
                vertices[worst] = std::move(contracted);
                values[worst] = f_contracted;
            } else {
                for (std::size_t v = 1; v < vertices.size(); v++) {
                    vertices[v] = clamp(move_towards(vertices[0], vertices[v], options_.sigma));
                    values[v] = safe_value(objective(vertices[v]));
                }
            }
        }

        sort_simplex();
    }

    result.point = vertices.front();
    result.value = values.front();
    return result;
}

} // namespace agerisk
