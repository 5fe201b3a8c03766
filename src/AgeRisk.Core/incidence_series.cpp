#include "incidence_series.h"
#include "string_util.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace agerisk::core {

IncidenceSeries::IncidenceSeries(std::vector<double> ages, std::vector<double> rates)
    : ages_{std::move(ages)}, rates_{std::move(rates)} {
    validate();
}

IncidenceSeries::IncidenceSeries(std::vector<double> ages, std::vector<double> rates,
                                 std::vector<int> years)
    : ages_{std::move(ages)}, rates_{std::move(rates)}, years_{std::move(years)} {
    if (years_.size() != ages_.size()) {
        throw InvalidInput(fmt::format("Series years size mismatch: {} vs {} ages.", years_.size(),
                                       ages_.size()));
    }

    validate();
}

std::size_t IncidenceSeries::size() const noexcept { return ages_.size(); }

bool IncidenceSeries::empty() const noexcept { return ages_.empty(); }

bool IncidenceSeries::has_years() const noexcept { return !years_.empty(); }

const std::vector<double> &IncidenceSeries::ages() const noexcept { return ages_; }

const std::vector<double> &IncidenceSeries::rates() const noexcept { return rates_; }

const std::vector<int> &IncidenceSeries::years() const noexcept { return years_; }

IncidencePoint IncidenceSeries::at(std::size_t index) const {
    auto point = IncidencePoint{.age = ages_.at(index), .rate = rates_.at(index)};
    if (has_years()) {
        point.year = years_.at(index);
    }

    return point;
}

double IncidenceSeries::max_rate() const noexcept {
    if (rates_.empty()) {
        return 0.0;
    }

    return *std::max_element(rates_.cbegin(), rates_.cend());
}

bool IncidenceSeries::all_zero() const noexcept {
    return std::all_of(rates_.cbegin(), rates_.cend(), [](double v) { return v == 0.0; });
}

double IncidenceSeries::rate_at(double age) const {
    if (empty()) {
        throw InvalidInput("Can not interpolate an empty incidence series.");
    }

    if (age <= ages_.front()) {
        return rates_.front();
    }

    if (age >= ages_.back()) {
        return rates_.back();
    }

    auto upper = std::upper_bound(ages_.cbegin(), ages_.cend(), age);
    auto index = static_cast<std::size_t>(std::distance(ages_.cbegin(), upper));
    auto x0 = ages_[index - 1];
    auto x1 = ages_[index];
    auto weight = (age - x0) / (x1 - x0);
    return rates_[index - 1] + weight * (rates_[index] - rates_[index - 1]);
}

IncidenceSeries IncidenceSeries::subset(const DoubleInterval &age_range) const {
    auto ages = std::vector<double>{};
    auto rates = std::vector<double>{};
    auto years = std::vector<int>{};
    for (std::size_t i = 0; i < ages_.size(); i++) {
        if (!age_range.contains(ages_[i])) {
            continue;
        }

        ages.emplace_back(ages_[i]);
        rates.emplace_back(rates_[i]);
        if (has_years()) {
            years.emplace_back(years_[i]);
        }
    }

    if (has_years()) {
        return IncidenceSeries{std::move(ages), std::move(rates), std::move(years)};
    }

    return IncidenceSeries{std::move(ages), std::move(rates)};
}

void IncidenceSeries::validate() const {
    if (ages_.size() != rates_.size()) {
        throw InvalidInput(fmt::format("Series size mismatch: {} ages vs {} rates.", ages_.size(),
                                       rates_.size()));
    }

    for (std::size_t i = 0; i < ages_.size(); i++) {
        if (!std::isfinite(ages_[i]) || ages_[i] < 0.0) {
            throw InvalidInput(fmt::format("Invalid age value: {} at index {}.", ages_[i], i));
        }

        if (!std::isfinite(rates_[i]) || rates_[i] < 0.0) {
            throw InvalidInput(fmt::format("Invalid rate value: {} at index {}.", rates_[i], i));
        }

        if (i > 0 && ages_[i] <= ages_[i - 1]) {
            throw InvalidInput(fmt::format("Ages must be strictly increasing: {} after {}.",
                                           ages_[i], ages_[i - 1]));
        }
    }
}

namespace {
constexpr double open_age_group_width = 5.0;

std::optional<DoubleInterval> parse_age_group(std::string_view age_group) {
    auto label = trim(std::string{age_group});
    if (label.empty() || case_insensitive::equals(label, "All Ages")) {
        return std::nullopt;
    }

    try {
        if (label.back() == '+') {
            label.pop_back();
            auto start = std::stod(label);
            return DoubleInterval{start, start + open_age_group_width};
        }

        if (label.find('-') != std::string::npos) {
            return parse_double_interval(label);
        }
    } catch (const std::logic_error &) {
        return std::nullopt;
    } catch (const InvalidInput &) {
        return std::nullopt;
    } catch (const InvalidParameter &) {
        return std::nullopt;
    }

    return std::nullopt;
}
} // namespace

std::optional<double> age_group_start(std::string_view age_group) {
    if (auto interval = parse_age_group(age_group)) {
        return interval->lower();
    }

    return std::nullopt;
}

std::optional<double> age_group_midpoint(std::string_view age_group) {
    if (auto interval = parse_age_group(age_group)) {
        return interval->midpoint();
    }

    return std::nullopt;
}

IncidenceSeries make_incidence_series(const std::vector<AgeGroupRate> &rows, int year) {
    auto points = std::vector<IncidencePoint>{};
    for (const auto &row : rows) {
        if (row.year != year) {
            continue;
        }

        if (auto age = age_group_midpoint(row.age_group)) {
            points.emplace_back(IncidencePoint{.age = age.value(), .rate = row.rate, .year = year});
        }
    }

    std::stable_sort(points.begin(), points.end(),
                     [](const auto &left, const auto &right) { return left.age < right.age; });

    auto ages = std::vector<double>{};
    auto rates = std::vector<double>{};
    auto years = std::vector<int>{};
    for (const auto &point : points) {
        ages.emplace_back(point.age);
        rates.emplace_back(point.rate);
        years.emplace_back(year);
    }

    return IncidenceSeries{std::move(ages), std::move(rates), std::move(years)};
}

} // namespace agerisk::core
