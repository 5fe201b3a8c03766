#include "AgeRisk.Input/configuration.h"
#include "command_options.h"
#include "model_comparison.h"
#include "version.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>

namespace {
std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", now, now.time_since_epoch());
}

/// @brief Resolves the worker thread limit
///
/// The command line value wins, then OMP_THREAD_LIMIT, then the hardware concurrency.
int thread_limit(const agerisk::CommandOptions &cmd_args) {
    if (cmd_args.num_threads > 0) {
        return static_cast<int>(cmd_args.num_threads);
    }

    if (const char *env_threads = std::getenv("OMP_THREAD_LIMIT")) {
        auto value = std::atoi(env_threads);
        if (value > 0) {
            return value;
        }
    }

    return tbb::this_task_arena::max_concurrency();
}

void print_banner() {
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "\n# {} {} #\n\n", PROJECT_NAME,
               PROJECT_VERSION);
    fmt::print("Started: {}\nWorker threads: {}\n\n", timestamp(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

int finish(int exit_code) {
    auto colour = exit_code == EXIT_SUCCESS ? fmt::color::yellow : fmt::color::red;
    fmt::print(fg(colour) | fmt::emphasis::bold, "\n\nFinished");
    fmt::print(" {}.\n\n", timestamp());
    return exit_code;
}

/// @brief Loads the configuration, runs the model comparison and prints the report
int run(const agerisk::CommandOptions &cmd_args) {
    using namespace agerisk;

    input::Configuration config;
    try {
        config = input::get_configuration(cmd_args.config_file, cmd_args.verbose);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return EXIT_FAILURE;
    }

    try {
        auto start = std::chrono::steady_clock::now();
        print_report(run_comparison(config));

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        fmt::print(fg(fmt::color::light_green), "\nComparison completed in {}ms\n",
                   elapsed.count());
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nModel comparison failed: {}.\n", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
} // anonymous namespace

/// @brief AgeRisk console entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace agerisk;

    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return finish(EXIT_FAILURE);
    }

    std::optional<CommandOptions> cmd_args;
    try {
        cmd_args = parse_arguments(options, argc, argv);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\nInvalid command line argument: {}\n", ex.what());
        fmt::print("\n{}\n", options.help());
        return finish(EXIT_FAILURE);
    }

    // --help and --version exit without a configuration
    if (!cmd_args.has_value()) {
        return EXIT_SUCCESS;
    }

    auto thread_control = tbb::global_control(tbb::global_control::max_allowed_parallelism,
                                              thread_limit(cmd_args.value()));
    print_banner();
    return finish(run(cmd_args.value()));
}
