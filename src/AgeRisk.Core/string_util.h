#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace agerisk::core {

/// @brief Removes leading and trailing white-space, e.g. around age group labels
/// @param value The text to trim
/// @return The trimmed text
std::string trim(std::string value) noexcept;

/// @brief Splits text on any of the delimiter characters, empty fields are dropped
/// @param value The text to split
/// @param delims The delimiter characters
/// @return Views into value, one per field
std::vector<std::string_view> split_string(const std::string_view &value,
                                           std::string_view delims) noexcept;

/// @brief ASCII comparisons ignoring case, for configuration names and labels
struct case_insensitive {
    /// @brief Compares two names, e.g. "Weibull" and "weibull" are equal
    static bool equals(const std::string_view &left, const std::string_view &right) noexcept;
};

} // namespace agerisk::core
