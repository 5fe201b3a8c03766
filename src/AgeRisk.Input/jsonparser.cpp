#include "jsonparser.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk.Core/math_util.h"

#include <fmt/format.h>

namespace agerisk::input::poco {
namespace {
template <class T> void get_optional(const json &j, const std::string &key, T &out) {
    if (j.contains(key)) {
        j.at(key).get_to(out);
    }
}

std::vector<double> get_axis(const json &j, const std::string &key) {
    if (!j.contains(key)) {
        return {};
    }

    const auto &node = j.at(key);
    if (node.is_array()) {
        return node.get<std::vector<double>>();
    }

    auto from = node.at("from").get<double>();
    auto to = node.at("to").get<double>();
    auto count = node.at("count").get<std::size_t>();
    auto scale = node.contains("scale") ? node.at("scale").get<std::string>() : "linear";
    try {
        if (scale == "log") {
            return core::log_space(from, to, count);
        }

        if (scale == "linear") {
            return core::linear_space(from, to, count);
        }
    } catch (const core::InvalidParameter &ex) {
        throw json::type_error::create(302, ex.what(), nullptr);
    }

    throw json::type_error::create(302, fmt::format("Unknown axis scale: {}", scale), nullptr);
}
} // namespace

//--------------------------------------------------------
// Data sections JSON serialisation / de-serialisation
//--------------------------------------------------------

// Incidence series
void to_json(json &j, const AgeGroupRateInfo &p) {
    j = json{{"age_group", p.age_group}, {"year", p.year}, {"rate", p.rate}};
}

void from_json(const json &j, AgeGroupRateInfo &p) {
    j.at("age_group").get_to(p.age_group);
    j.at("year").get_to(p.year);
    j.at("rate").get_to(p.rate);
}

void to_json(json &j, const SeriesInfo &p) {
    j = json::object();
    if (!p.age_groups.empty()) {
        j["age_groups"] = p.age_groups;
        j["year"] = p.year;
    } else {
        j["ages"] = p.ages;
        j["rates"] = p.rates;
        if (!p.years.empty()) {
            j["years"] = p.years;
        }
    }

    if (p.age_range.has_value()) {
        j["age_range"] = p.age_range.value();
    }
}

void from_json(const json &j, SeriesInfo &p) {
    if (j.contains("age_groups")) {
        j.at("age_groups").get_to(p.age_groups);
        j.at("year").get_to(p.year);
    } else {
        j.at("ages").get_to(p.ages);
        j.at("rates").get_to(p.rates);
        get_optional(j, "years", p.years);
    }

    get_optional(j, "age_range", p.age_range);
}

// Tissue observations
void to_json(json &j, const TissueInfo &p) {
    j = json{{"tissue_id", p.tissue_id},
             {"lscd", p.lscd},
             {"incidence", p.incidence},
             {"group", p.group}};
}

void from_json(const json &j, TissueInfo &p) {
    j.at("tissue_id").get_to(p.tissue_id);
    j.at("lscd").get_to(p.lscd);
    j.at("incidence").get_to(p.incidence);
    get_optional(j, "group", p.group);
}

//--------------------------------------------------------
// Models sections JSON serialisation / de-serialisation
//--------------------------------------------------------

// Mutation accumulation model
void to_json(json &j, const LogNormalInfo &p) { j = json{{"mu", p.mu}, {"sigma", p.sigma}}; }

void from_json(const json &j, LogNormalInfo &p) {
    j.at("mu").get_to(p.mu);
    j.at("sigma").get_to(p.sigma);
}

void to_json(json &j, const ModelInfo &p) {
    j = json{{"p", p.p},
             {"clones", p.clones},
             {"divisions_per_year", p.divisions_per_year},
             {"repair_efficiency", p.repair_efficiency},
             {"clonal_threshold", p.clonal_threshold},
             {"rate_distribution", p.rate_distribution}};
}

void from_json(const json &j, ModelInfo &p) {
    j.at("p").get_to(p.p);
    j.at("clones").get_to(p.clones);
    j.at("divisions_per_year").get_to(p.divisions_per_year);
    get_optional(j, "repair_efficiency", p.repair_efficiency);
    get_optional(j, "clonal_threshold", p.clonal_threshold);
    get_optional(j, "rate_distribution", p.rate_distribution);
}

// Calibration grid
void to_json(json &j, const GridInfo &p) {
    j = json{{"p", p.p},
             {"repair_efficiency", p.repair_efficiency},
             {"clonal_threshold", p.clonal_threshold},
             {"clones", p.clones},
             {"divisions_per_year", p.divisions_per_year}};
}

void from_json(const json &j, GridInfo &p) {
    p.p = get_axis(j, "p");
    p.repair_efficiency = get_axis(j, "repair_efficiency");
    p.divisions_per_year = get_axis(j, "divisions_per_year");
    get_optional(j, "clonal_threshold", p.clonal_threshold);
    get_optional(j, "clones", p.clones);
}

void to_json(json &j, const CalibrationInfo &p) {
    j = json{{"objective", p.objective}, {"tie_tolerance", p.tie_tolerance}};
}

void from_json(const json &j, CalibrationInfo &p) {
    get_optional(j, "objective", p.objective);
    get_optional(j, "tie_tolerance", p.tie_tolerance);
}

void to_json(json &j, const MonteCarloInfo &p) {
    j = json{{"seed", p.seed},
             {"simulated_clones", p.simulated_clones},
             {"block_size", p.block_size}};
}

void from_json(const json &j, MonteCarloInfo &p) {
    j.at("seed").get_to(p.seed);
    get_optional(j, "simulated_clones", p.simulated_clones);
    get_optional(j, "block_size", p.block_size);
}

// Hazard regression
void to_json(json &j, const HazardInfo &p) {
    j = json{{"forms", p.forms}, {"rate_unit", p.rate_unit}, {"max_iterations", p.max_iterations}};
}

void from_json(const json &j, HazardInfo &p) {
    get_optional(j, "forms", p.forms);
    get_optional(j, "rate_unit", p.rate_unit);
    get_optional(j, "max_iterations", p.max_iterations);
}

// Model evaluation
void to_json(json &j, const EvaluationInfo &p) {
    j = json{{"checkpoints", p.checkpoints},
             {"checkpoint_step", p.checkpoint_step},
             {"rate_unit", p.rate_unit},
             {"family", p.family}};
}

void from_json(const json &j, EvaluationInfo &p) {
    get_optional(j, "checkpoints", p.checkpoints);
    get_optional(j, "checkpoint_step", p.checkpoint_step);
    get_optional(j, "rate_unit", p.rate_unit);
    get_optional(j, "family", p.family);
}

} // namespace agerisk::input::poco
