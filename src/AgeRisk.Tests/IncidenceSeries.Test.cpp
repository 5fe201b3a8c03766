#include "pch.h"

#include "AgeRisk.Core/exception.h"
#include "AgeRisk.Core/incidence_series.h"

#include <limits>

using namespace agerisk::core;

TEST(TestCore_IncidenceSeries, CreateEmpty) {
    auto series = IncidenceSeries{};
    ASSERT_TRUE(series.empty());
    ASSERT_EQ(0u, series.size());
    ASSERT_EQ(0.0, series.max_rate());
    ASSERT_TRUE(series.all_zero());
    ASSERT_THROW(series.rate_at(10.0), InvalidInput);
}

TEST(TestCore_IncidenceSeries, CreateWithYears) {
    auto series = IncidenceSeries{{40.0, 60.0, 80.0}, {10.0, 100.0, 450.0}, {2019, 2019, 2019}};

    ASSERT_EQ(3u, series.size());
    ASSERT_TRUE(series.has_years());
    ASSERT_EQ(450.0, series.max_rate());
    ASSERT_FALSE(series.all_zero());

    auto point = series.at(1);
    ASSERT_EQ(60.0, point.age);
    ASSERT_EQ(100.0, point.rate);
    ASSERT_TRUE(point.year.has_value());
    ASSERT_EQ(2019, point.year.value());
    ASSERT_THROW(series.at(3), std::out_of_range);
}

TEST(TestCore_IncidenceSeries, CreateInvalidThrows) {
    auto nan = std::numeric_limits<double>::quiet_NaN();

    // Not strictly increasing
    ASSERT_THROW(IncidenceSeries({10.0, 10.0}, {1.0, 2.0}), InvalidInput);
    ASSERT_THROW(IncidenceSeries({20.0, 10.0}, {1.0, 2.0}), InvalidInput);

    // Size mismatch
    ASSERT_THROW(IncidenceSeries({10.0, 20.0}, {1.0}), InvalidInput);
    ASSERT_THROW(IncidenceSeries({10.0, 20.0}, {1.0, 2.0}, {2019}), InvalidInput);

    // Negative or non finite values
    ASSERT_THROW(IncidenceSeries({-1.0, 20.0}, {1.0, 2.0}), InvalidInput);
    ASSERT_THROW(IncidenceSeries({10.0, 20.0}, {-1.0, 2.0}), InvalidInput);
    ASSERT_THROW(IncidenceSeries({10.0, 20.0}, {nan, 2.0}), InvalidInput);
}

TEST(TestCore_IncidenceSeries, RateInterpolation) {
    auto series = IncidenceSeries{{40.0, 60.0, 80.0}, {10.0, 110.0, 450.0}};

    ASSERT_EQ(10.0, series.rate_at(20.0));
    ASSERT_EQ(10.0, series.rate_at(40.0));
    ASSERT_DOUBLE_EQ(60.0, series.rate_at(50.0));
    ASSERT_EQ(110.0, series.rate_at(60.0));
    ASSERT_DOUBLE_EQ(280.0, series.rate_at(70.0));
    ASSERT_EQ(450.0, series.rate_at(90.0));
}

TEST(TestCore_IncidenceSeries, SubsetByAgeRange) {
    auto series = IncidenceSeries{{40.0, 60.0, 80.0}, {10.0, 110.0, 450.0}, {2018, 2019, 2020}};

    auto subset = series.subset(DoubleInterval{50.0, 80.0});
    ASSERT_EQ(2u, subset.size());
    ASSERT_EQ(60.0, subset.ages().front());
    ASSERT_EQ(450.0, subset.rates().back());
    ASSERT_EQ(2020, subset.years().back());

    auto none = series.subset(DoubleInterval{0.0, 30.0});
    ASSERT_TRUE(none.empty());
}

TEST(TestCore_IncidenceSeries, AgeGroupLabels) {
    ASSERT_EQ(72.0, age_group_midpoint("70-74").value());
    ASSERT_EQ(70.0, age_group_start("70-74").value());
    ASSERT_EQ(87.5, age_group_midpoint("85+").value());
    ASSERT_EQ(85.0, age_group_start("85+").value());
    ASSERT_EQ(2.0, age_group_midpoint(" 0-4 ").value());

    ASSERT_FALSE(age_group_midpoint("All Ages").has_value());
    ASSERT_FALSE(age_group_start("all ages").has_value());
    ASSERT_FALSE(age_group_midpoint("unknown").has_value());
    ASSERT_FALSE(age_group_midpoint("").has_value());
}

TEST(TestCore_IncidenceSeries, MakeFromAgeGroupRows) {
    auto rows = std::vector<AgeGroupRate>{
        {.age_group = "85+", .year = 2019, .rate = 520.0},
        {.age_group = "All Ages", .year = 2019, .rate = 90.0},
        {.age_group = "40-44", .year = 2019, .rate = 30.0},
        {.age_group = "40-44", .year = 2018, .rate = 28.0},
        {.age_group = "70-74", .year = 2019, .rate = 300.0},
    };

    auto series = make_incidence_series(rows, 2019);
    ASSERT_EQ(3u, series.size());
    ASSERT_EQ(42.0, series.ages()[0]);
    ASSERT_EQ(72.0, series.ages()[1]);
    ASSERT_EQ(87.5, series.ages()[2]);
    ASSERT_EQ(30.0, series.rates()[0]);
    ASSERT_EQ(520.0, series.rates()[2]);
    ASSERT_TRUE(series.has_years());

    auto other = make_incidence_series(rows, 2018);
    ASSERT_EQ(1u, other.size());
    ASSERT_EQ(28.0, other.rates().front());
}
