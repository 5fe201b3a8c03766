#pragma once
#include "poco.h"

#include <nlohmann/json.hpp>
#include <optional>

namespace agerisk::input::poco {
/// @brief JSON parser namespace alias.
///
/// Configuration file serialisation / de-serialisation mapping specific
/// to the `JSON for Modern C++` library adopted by the project.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
using json = nlohmann::json;

//--------------------------------------------------------
// Data sections POCO types mapping
//--------------------------------------------------------

// Incidence series
void to_json(json &j, const AgeGroupRateInfo &p);
void from_json(const json &j, AgeGroupRateInfo &p);

void to_json(json &j, const SeriesInfo &p);
void from_json(const json &j, SeriesInfo &p);

// Tissue observations
void to_json(json &j, const TissueInfo &p);
void from_json(const json &j, TissueInfo &p);

//--------------------------------------------------------
// Models sections POCO types mapping
//--------------------------------------------------------

// Mutation accumulation model
void to_json(json &j, const LogNormalInfo &p);
void from_json(const json &j, LogNormalInfo &p);

void to_json(json &j, const ModelInfo &p);
void from_json(const json &j, ModelInfo &p);

// Calibration grid, axes are given as values or as {from, to, count, scale}
void to_json(json &j, const GridInfo &p);
void from_json(const json &j, GridInfo &p);

void to_json(json &j, const CalibrationInfo &p);
void from_json(const json &j, CalibrationInfo &p);

void to_json(json &j, const MonteCarloInfo &p);
void from_json(const json &j, MonteCarloInfo &p);

// Hazard regression
void to_json(json &j, const HazardInfo &p);
void from_json(const json &j, HazardInfo &p);

// Model evaluation
void to_json(json &j, const EvaluationInfo &p);
void from_json(const json &j, EvaluationInfo &p);

} // namespace agerisk::input::poco

namespace agerisk::core {
using json = nlohmann::json;

template <class T> void to_json(json &j, const Interval<T> &interval) {
    j = json::array({interval.lower(), interval.upper()});
}

template <class T> void from_json(const json &j, Interval<T> &interval) {
    const auto vec = j.get<std::vector<T>>();
    if (vec.size() != 2) {
        throw json::type_error::create(302, "Interval arrays must have only two elements", nullptr);
    }

    if (vec[0] > vec[1]) {
        throw json::type_error::create(302, "Interval lower bound above upper bound", nullptr);
    }

    interval = Interval<T>{vec[0], vec[1]};
}
} // namespace agerisk::core

namespace std {

// Optional parameters
template <typename T> void to_json(nlohmann::json &j, const std::optional<T> &p) {
    if (p) {
        j = *p;
    } else {
        j = nullptr;
    }
}
template <typename T> void from_json(const nlohmann::json &j, std::optional<T> &p) {
    if (j.is_null()) {
        p = std::nullopt;
    } else {
        p = j.get<T>();
    }
}

} // namespace std
