#pragma once

#include "exception.h"
#include "forward_type.h"

#include <compare>
#include <fmt/format.h>
#include <string_view>

namespace agerisk::core {

/// @brief Closed numeric range [lower, upper], used for age groups and age filters
///
/// @details Both bounds are inclusive, a default range is the single point zero.
/// @tparam TYPE The numerical type of the bounds
template <Numerical TYPE> class Interval {
  public:
    Interval() = default;

    /// @brief Initialises a new instance of the Interval class
    /// @param lower_value The first value in the range
    /// @param upper_value The last value in the range, not below lower_value
    /// @throws InvalidParameter for inverted bounds
    explicit Interval(TYPE lower_value, TYPE upper_value)
        : lower_{lower_value}, upper_{upper_value} {
        if (lower_ > upper_) {
            throw InvalidParameter(fmt::format("Invalid interval: {}-{}", lower_, upper_));
        }
    }

    TYPE lower() const noexcept { return lower_; }

    TYPE upper() const noexcept { return upper_; }

    /// @brief Centre of the range, the representative age of an age group
    double midpoint() const noexcept {
        return (static_cast<double>(lower_) + static_cast<double>(upper_)) / 2.0;
    }

    /// @brief Checks whether a value falls inside the range, bounds included
    bool contains(TYPE value) const noexcept { return lower_ <= value && value <= upper_; }

    /// @brief Orders ranges by lower bound, then upper bound
    auto operator<=>(const Interval<TYPE> &rhs) const = default;

  private:
    TYPE lower_{};
    TYPE upper_{};
};

/// @brief Fractional ages range
using DoubleInterval = Interval<double>;

/// @brief Parses a range label such as "70-74" into a DoubleInterval
/// @param value The label to parse
/// @param delims The bounds separator
/// @return The parsed range
/// @throws InvalidInput for labels without exactly two numeric bounds
/// @throws InvalidParameter for inverted bounds
DoubleInterval parse_double_interval(const std::string_view &value,
                                     const std::string_view delims = "-");
} // namespace agerisk::core
