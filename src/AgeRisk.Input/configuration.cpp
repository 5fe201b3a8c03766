#include "configuration.h"
#include "configuration_parsing.h"
#include "jsonparser.h"

#include "AgeRisk.Core/scoped_timer.h"

#include <fmt/color.h>

#include <fstream>
#include <utility>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    agerisk::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace agerisk::input {
using json = nlohmann::json;

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

Configuration get_configuration(const std::filesystem::path &config_file, bool verbose) {
    MEASURE_FUNCTION();
    if (!std::filesystem::exists(config_file)) {
        throw ConfigurationError{
            fmt::format("Configuration file: {} not found", config_file.string())};
    }

    std::ifstream ifs{config_file};
    if (!ifs) {
        throw ConfigurationError{
            fmt::format("Could not open configuration file: {}", config_file.string())};
    }

    json opt;
    try {
        opt = json::parse(ifs);
    } catch (const json::parse_error &ex) {
        throw ConfigurationError{fmt::format("Malformed configuration file: {}", ex.what())};
    }

    auto config = get_configuration(opt, verbose);
    config.root_path = std::filesystem::absolute(config_file).parent_path();
    return config;
}

Configuration get_configuration(const json &opt, bool verbose) {
    bool success = true;

    Configuration config;
    config.verbosity = core::VerboseMode::none;
    if (verbose) {
        config.verbosity = core::VerboseMode::verbose;
    }

    check_version(opt);

    try {
        load_series_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load incidence series: {}\n", e.what());
    }

    try {
        load_tissues_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load tissues info: {}\n", e.what());
    }

    try {
        load_calibration_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load calibration info: {}\n", e.what());
    }

    try {
        load_hazard_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load hazard info: {}\n", e.what());
    }

    try {
        load_evaluation_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load evaluation info: {}\n", e.what());
    }

    if (!success) {
        throw ConfigurationError{"Error loading config file"};
    }

    return config;
}

core::IncidenceSeries create_incidence_series(const poco::SeriesInfo &info) {
    try {
        auto series = core::IncidenceSeries{};
        if (!info.age_groups.empty()) {
            if (!info.year.has_value()) {
                throw ConfigurationError{"Age group series must name the target year"};
            }

            auto rows = std::vector<core::AgeGroupRate>{};
            rows.reserve(info.age_groups.size());
            for (const auto &item : info.age_groups) {
                rows.emplace_back(core::AgeGroupRate{
                    .age_group = item.age_group, .year = item.year, .rate = item.rate});
            }

            series = core::make_incidence_series(rows, info.year.value());
        } else if (info.years.empty()) {
            series = core::IncidenceSeries{info.ages, info.rates};
        } else {
            series = core::IncidenceSeries{info.ages, info.rates, info.years};
        }

        if (info.age_range.has_value()) {
            series = series.subset(info.age_range.value());
        }

        if (series.empty()) {
            throw ConfigurationError{"Incidence series has no ages"};
        }

        return series;
    } catch (const core::AgeRiskException &ex) {
        throw ConfigurationError{fmt::format("Invalid incidence series: {}", ex.what())};
    }
}

ModelAParameters create_model_parameters(const poco::ModelInfo &info) {
    auto parameters = ModelAParameters{
        .p = info.p,
        .clones = info.clones,
        .divisions_per_year = info.divisions_per_year,
        .rate_distribution = std::nullopt,
        .repair_efficiency = info.repair_efficiency,
        .clonal_threshold = info.clonal_threshold,
    };

    if (info.rate_distribution.has_value()) {
        parameters.rate_distribution =
            LogNormalRate{.mu = info.rate_distribution->mu, .sigma = info.rate_distribution->sigma};
    }

    try {
        validate(parameters);
    } catch (const core::InvalidParameter &ex) {
        throw ConfigurationError{fmt::format("Invalid model parameters: {}", ex.what())};
    }

    return parameters;
}
} // namespace agerisk::input
