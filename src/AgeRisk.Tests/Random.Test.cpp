#include "pch.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk/mtrandom.h"
#include "AgeRisk/random_algorithm.h"

#include <cmath>
#include <vector>

using namespace agerisk;

TEST(TestRandom_Generator, SameSeedSameSequence) {
    auto first = MTRandom32{123};
    auto second = MTRandom32{123};
    for (auto i = 0; i < 100; i++) {
        ASSERT_EQ(first(), second());
        ASSERT_EQ(first.next_double(), second.next_double());
    }

    auto restarted = MTRandom32{123};
    auto other = MTRandom32{124};
    auto differs = false;
    for (auto i = 0; i < 10; i++) {
        differs |= (restarted() != other());
    }

    ASSERT_TRUE(differs);
}

TEST(TestRandom_Generator, NextDoubleInUnitRange) {
    auto engine = MTRandom32{42};
    for (auto i = 0; i < 10000; i++) {
        auto value = engine.next_double();
        ASSERT_LE(0.0, value);
        ASSERT_GT(1.0, value);
    }
}

TEST(TestRandom_Algorithm, GeometricTrialsMean) {
    auto engine = MTRandom32{2023};
    auto rnd = Random{engine};
    const auto probability = 0.05;
    const auto samples = 200000;

    auto sum = 0.0;
    for (auto i = 0; i < samples; i++) {
        auto trials = rnd.next_geometric(probability);
        ASSERT_LE(1.0, trials);
        ASSERT_EQ(trials, std::floor(trials));
        sum += trials;
    }

    // Mean 1/p = 20, standard error about 0.044
    ASSERT_NEAR(1.0 / probability, sum / samples, 0.3);
}

TEST(TestRandom_Algorithm, GeometricCertainSuccess) {
    auto engine = MTRandom32{1};
    auto rnd = Random{engine};
    ASSERT_EQ(1.0, rnd.next_geometric(1.0));
}

TEST(TestRandom_Algorithm, GeometricInvalidProbability) {
    auto engine = MTRandom32{1};
    auto rnd = Random{engine};
    ASSERT_THROW(rnd.next_geometric(0.0), core::InvalidParameter);
    ASSERT_THROW(rnd.next_geometric(-0.1), core::InvalidParameter);
    ASSERT_THROW(rnd.next_geometric(1.1), core::InvalidParameter);
    ASSERT_THROW(rnd.next_geometric(std::nan("")), core::InvalidParameter);
}

TEST(TestRandom_Algorithm, NormalMoments) {
    auto engine = MTRandom32{99};
    auto rnd = Random{engine};
    const auto samples = 100000;

    auto values = std::vector<double>{};
    values.reserve(samples);
    for (auto i = 0; i < samples; i++) {
        values.emplace_back(rnd.next_normal(5.0, 2.0));
    }

    auto mean = 0.0;
    for (auto value : values) {
        mean += value;
    }

    mean /= samples;
    auto variance = 0.0;
    for (auto value : values) {
        variance += (value - mean) * (value - mean);
    }

    variance /= (samples - 1);
    ASSERT_NEAR(5.0, mean, 0.05);
    ASSERT_NEAR(2.0, std::sqrt(variance), 0.05);
    ASSERT_THROW(rnd.next_normal(0.0, 0.0), core::InvalidParameter);
}

TEST(TestRandom_Algorithm, LogNormalPositive) {
    auto engine = MTRandom32{5};
    auto rnd = Random{engine};
    const auto samples = 100000;

    auto log_sum = 0.0;
    for (auto i = 0; i < samples; i++) {
        auto value = rnd.next_lognormal(-2.0, 0.5);
        ASSERT_LT(0.0, value);
        log_sum += std::log(value);
    }

    ASSERT_NEAR(-2.0, log_sum / samples, 0.02);
    ASSERT_THROW(rnd.next_lognormal(0.0, -1.0), core::InvalidParameter);
}
