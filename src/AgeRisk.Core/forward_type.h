#pragma once
#include <cstdint>
#include <type_traits>

// forward type declaration
namespace agerisk::core {

/// @brief Verbosity mode enumeration
enum class VerboseMode : uint8_t {
    /// @brief only report errors
    none,

    /// @brief Print more information about actions, including warning
    verbose
};

/// @brief C++20 concept for numeric value types
template <typename T>
concept Numerical = std::is_arithmetic_v<T>;

class IncidenceSeries;
struct IncidencePoint;
struct TissueObservation;

} // namespace agerisk::core
