#include "pch.h"
#include "AgeRisk.Core/exception.h"
#include "AgeRisk.Core/math_util.h"

#include <cmath>
#include <limits>

TEST(TestCore_MathHelper, MachinePrecision) {
    using namespace agerisk::core;

    auto precision = MathHelper::machine_precision();
    ASSERT_LT(0.0, precision);
    ASSERT_EQ(std::numeric_limits<double>::epsilon(), precision);
}

TEST(TestCore_MathHelper, NumericalPrecision) {
    using namespace agerisk::core;

    auto precision = MathHelper::default_numerical_precision();
    ASSERT_LT(0.0, precision);
    ASSERT_LT(MathHelper::machine_precision(), precision);
}

TEST(TestCore_MathHelper, EqualsDefaultPrecision) {
    using namespace agerisk::core;
    double a = (0.3 * 3.0) + 0.1;
    double b = 1.0;
    ASSERT_TRUE(MathHelper::equal(a, b));
}

TEST(TestCore_MathHelper, EqualsCustomPrecision) {
    using namespace agerisk::core;
    ASSERT_TRUE(MathHelper::equal(1.0, 1.0 + 1e-13, 1e-12));
    ASSERT_FALSE(MathHelper::equal(1.0, 1.0 + 1e-11, 1e-12));
}

TEST(TestCore_MathHelper, EqualsZeroPrecision) {
    using namespace agerisk::core;
    ASSERT_TRUE(MathHelper::equal(0.0, 1e-15));
}

TEST(TestCore_MathHelper, AtLeastOneSmallProbability) {
    using namespace agerisk::core;

    // 1 - (1 - p)^n loses every digit in naive evaluation at this scale.
    auto p = 1e-12;
    auto n = 1e6;
    auto expected = n * p;
    ASSERT_NEAR(expected, MathHelper::at_least_one(p, n), expected * 1e-5);
}

TEST(TestCore_MathHelper, AtLeastOneBounds) {
    using namespace agerisk::core;
    ASSERT_EQ(0.0, MathHelper::at_least_one(0.0, 100.0));
    ASSERT_EQ(0.0, MathHelper::at_least_one(0.5, 0.0));
    ASSERT_EQ(1.0, MathHelper::at_least_one(1.0, 3.0));
    ASSERT_NEAR(0.75, MathHelper::at_least_one(0.5, 2.0), 1e-15);
}

TEST(TestCore_MathHelper, LogBinomialProbabilityMass) {
    using namespace agerisk::core;

    // C(5, 2) * 0.3^2 * 0.7^3
    auto expected = 10.0 * 0.09 * 0.343;
    ASSERT_NEAR(expected, std::exp(MathHelper::log_binomial_pmf(2.0, 5.0, 0.3)), 1e-12);
    ASSERT_NEAR(std::log(10.0), MathHelper::log_choose(5.0, 2.0), 1e-12);
}

TEST(TestCore_MathHelper, LinearSpace) {
    using namespace agerisk::core;

    auto values = linear_space(0.0, 1.0, 5);
    ASSERT_EQ(5u, values.size());
    ASSERT_EQ(0.0, values.front());
    ASSERT_EQ(1.0, values.back());
    ASSERT_NEAR(0.25, values[1], 1e-15);

    auto single = linear_space(2.0, 3.0, 1);
    ASSERT_EQ(1u, single.size());
    ASSERT_EQ(2.0, single.front());
}

TEST(TestCore_MathHelper, LogSpace) {
    using namespace agerisk::core;

    auto values = log_space(1e-10, 1e-8, 3);
    ASSERT_EQ(3u, values.size());
    ASSERT_EQ(1e-10, values[0]);
    ASSERT_NEAR(1e-9, values[1], 1e-21);
    ASSERT_EQ(1e-8, values[2]);

    auto single = log_space(1e-9, 1e-8, 1);
    ASSERT_EQ(1u, single.size());
    ASSERT_EQ(1e-9, single.front());
}

TEST(TestCore_MathHelper, SpaceInvalidArguments) {
    using namespace agerisk::core;

    ASSERT_THROW(linear_space(0.0, 1.0, 0), InvalidParameter);
    ASSERT_THROW(linear_space(2.0, 1.0, 3), InvalidParameter);
    ASSERT_THROW(log_space(0.0, 1.0, 3), InvalidParameter);
    ASSERT_THROW(log_space(1e-8, 1e-10, 3), InvalidParameter);
}
