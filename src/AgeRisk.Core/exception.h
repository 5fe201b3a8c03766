#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// HACK: Clang 14 does not support std::source_location.
#if defined(__clang__) && __clang_major__ <= 14
#include <experimental/source_location>
using std::experimental::source_location;
#else
#include <source_location>
using std::source_location;
#endif // defined(__clang__) && __clang_major__ <= 14

namespace agerisk::core {

/// @brief AgeRisk base exception class, with source location information
class AgeRiskException : public std::runtime_error {
  public:
    /// @brief Construct a new AgeRiskException
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    AgeRiskException(const std::string &what_arg,
                     const source_location location = source_location::current());

    /// @brief Gets the exception message, prefixed with the source location
    /// @return The exception message
    const char *what() const noexcept override;

    /// @brief Gets the exception source location line
    /// @return The location line
    std::uint_least32_t line() const noexcept;

    /// @brief Gets the exception source location file name
    /// @return The location file name
    const char *file_name() const noexcept;

    /// @brief Gets the exception source location function name
    /// @return The location function name
    const char *function_name() const noexcept;

  private:
    source_location location_;
    std::string what_arg_;
};

/// @brief Model parameter outside of its valid domain
class InvalidParameter : public AgeRiskException {
  public:
    InvalidParameter(const std::string &what_arg,
                     const source_location location = source_location::current())
        : AgeRiskException{what_arg, location} {}
};

/// @brief Malformed input series, e.g. negative or non-increasing ages
class InvalidInput : public AgeRiskException {
  public:
    InvalidInput(const std::string &what_arg,
                 const source_location location = source_location::current())
        : AgeRiskException{what_arg, location} {}
};

/// @brief Calibration target carries no signal (empty or all zero)
class DegenerateTarget : public AgeRiskException {
  public:
    DegenerateTarget(const std::string &what_arg,
                     const source_location location = source_location::current())
        : AgeRiskException{what_arg, location} {}
};

/// @brief Model fitting failed to reach a valid optimum
class FitDidNotConverge : public AgeRiskException {
  public:
    FitDidNotConverge(const std::string &what_arg,
                      const source_location location = source_location::current())
        : AgeRiskException{what_arg, location} {}
};

} // namespace agerisk::core
