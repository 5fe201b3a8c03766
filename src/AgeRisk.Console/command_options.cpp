#include "command_options.h"
#include "version.h"

#include <fmt/color.h>

#include <filesystem>
#include <iostream>

namespace agerisk {

cxxopts::Options create_options() {
    cxxopts::Options options("AgeRisk.Console",
                             "Age-dependent cancer incidence models calibration and comparison.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("T,threads", "The maximum number of threads to create (0: no limit, default).",
            cxxopts::value<size_t>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::runtime_error("Missing required configuration file argument.");
    }

    cmd.config_file = result["config"].as<std::string>();
    if (!std::filesystem::exists(cmd.config_file)) {
        throw std::runtime_error(
            fmt::format("Configuration file: {} not found.", cmd.config_file));
    }

    fmt::print("Configuration file: {}\n", cmd.config_file);

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<size_t>();
    }

    return cmd;
}
} // namespace agerisk
