#pragma once

#include "interval.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agerisk::core {

/// @brief Single age-specific incidence observation
struct IncidencePoint {
    /// @brief Age in whole or fractional years
    double age{};

    /// @brief Incidence rate per population unit, e.g. per 100,000
    double rate{};

    /// @brief Calendar year of the observation, optional
    std::optional<int> year{};
};

/// @brief Defines an age to incidence rate data series
///
/// @details The series is immutable once constructed. Ages must be non-negative
/// and strictly increasing, rates must be non-negative. The parsing of external
/// statistics tables into this shape is the responsibility of the caller.
class IncidenceSeries {
  public:
    /// @brief Initialises a new instance of the IncidenceSeries class, empty.
    IncidenceSeries() = default;

    /// @brief Initialises a new instance of the IncidenceSeries class.
    /// @param ages The ages in years, strictly increasing
    /// @param rates The incidence rate at each age
    /// @throws InvalidInput for size mismatch, negative or non-increasing values
    IncidenceSeries(std::vector<double> ages, std::vector<double> rates);

    /// @brief Initialises a new instance of the IncidenceSeries class with years.
    /// @param ages The ages in years, strictly increasing
    /// @param rates The incidence rate at each age
    /// @param years The calendar year of each observation
    /// @throws InvalidInput for size mismatch, negative or non-increasing values
    IncidenceSeries(std::vector<double> ages, std::vector<double> rates, std::vector<int> years);

    /// @brief Gets the number of observations
    std::size_t size() const noexcept;

    /// @brief Determine whether the series is empty
    bool empty() const noexcept;

    /// @brief Determine whether the series carries calendar years
    bool has_years() const noexcept;

    /// @brief Gets the observations age values
    const std::vector<double> &ages() const noexcept;

    /// @brief Gets the observations rate values
    const std::vector<double> &rates() const noexcept;

    /// @brief Gets the observations calendar years, empty if not available
    const std::vector<int> &years() const noexcept;

    /// @brief Gets a single observation with bounds checking
    /// @param index The observation index
    /// @return The observation at index
    IncidencePoint at(std::size_t index) const;

    /// @brief Gets the largest rate value in the series, zero if empty
    double max_rate() const noexcept;

    /// @brief Determine whether all rates are zero, true for an empty series
    bool all_zero() const noexcept;

    /// @brief Gets the rate at a given age by linear interpolation
    ///
    /// Ages outside the series range take the nearest end value.
    /// @param age The age to interpolate
    /// @return The interpolated rate
    /// @throws InvalidInput for an empty series
    double rate_at(double age) const;

    /// @brief Creates a new series with the observations inside an age range
    /// @param age_range The closed age interval
    /// @return The series subset, possibly empty
    IncidenceSeries subset(const DoubleInterval &age_range) const;

  private:
    std::vector<double> ages_;
    std::vector<double> rates_;
    std::vector<int> years_;

    void validate() const;
};

/// @brief Age group labelled incidence row, as read from a statistics table
struct AgeGroupRate {
    /// @brief Age group label, e.g. "70-74", "85+" or "All Ages"
    std::string age_group;

    /// @brief Calendar year
    int year{};

    /// @brief Incidence rate for the age group
    double rate{};
};

/// @brief Converts an age group label into its starting age
/// @param age_group The age group label, e.g. "70-74" or "85+"
/// @return The starting age, or std::nullopt for totals and unparseable labels
std::optional<double> age_group_start(std::string_view age_group);

/// @brief Converts an age group label into its mid point age
///
/// Open-ended groups such as "85+" are assumed to be five years wide.
/// @param age_group The age group label, e.g. "70-74" or "85+"
/// @return The mid point age, or std::nullopt for totals and unparseable labels
std::optional<double> age_group_midpoint(std::string_view age_group);

/// @brief Creates the age incidence series for a single calendar year
/// @param rows The age group labelled rows, any order and years
/// @param year The target calendar year
/// @return The series ordered by age group mid point
/// @throws InvalidInput for duplicated age groups or negative rates
IncidenceSeries make_incidence_series(const std::vector<AgeGroupRate> &rows, int year);

} // namespace agerisk::core
