#include "pch.h"

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>

cxxopts::Options create_options() {
    cxxopts::Options options("AgeRisk.Tests", "AgeRisk cancer incidence models test.");
    options.allow_unrecognised_options();
    options.add_options()("help", "Help about this test application.");
    return options;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "\nInitialising with a custom GTest main function.\n\n";

    auto options = create_options();
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return EXIT_SUCCESS;
    }

    std::cout << "Test location..: " << std::filesystem::current_path().string() << "\n\n";
    return RUN_ALL_TESTS();
}
