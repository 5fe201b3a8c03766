#pragma once

#include <string>

namespace agerisk::core {

/// @brief Lifetime incidence observation for a single tissue
struct TissueObservation {
    /// @brief The tissue identifier
    std::string tissue_id;

    /// @brief Lifetime stem cell divisions (LSCD), strictly positive
    double lscd{};

    /// @brief Lifetime cancer incidence, strictly positive
    double incidence{};

    /// @brief Optional fixed effect group, e.g. organ system; empty for none
    std::string group{};
};

} // namespace agerisk::core
