#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "sampen_core.hpp"

using fastsampen::InvalidParameter;
using fastsampen::SampEnResult;
using fastsampen::SampEnStatus;

TEST(SampleEntropyReducer, NoMatchesIsUndefined) {
    SampEnResult res = fastsampen::sample_entropy(0, 0);
    EXPECT_TRUE(res.is_undefined());
    EXPECT_TRUE(std::isnan(res.value));
}

TEST(SampleEntropyReducer, NoExtendedMatchesIsInfinite) {
    SampEnResult res = fastsampen::sample_entropy(10, 0);
    EXPECT_TRUE(res.is_infinite());
    EXPECT_FALSE(res.is_undefined());
    EXPECT_TRUE(std::isinf(res.value));
    EXPECT_GT(res.value, 0.0);
}

TEST(SampleEntropyReducer, NegativeLogRatio) {
    SampEnResult res = fastsampen::sample_entropy(10, 6);
    EXPECT_TRUE(res.is_finite());
    EXPECT_DOUBLE_EQ(res.value, -std::log(6.0 / 10.0));

    SampEnResult same = fastsampen::sample_entropy(fastsampen::MatchCounts{4, 4});
    EXPECT_TRUE(same.is_finite());
    EXPECT_DOUBLE_EQ(same.value, 0.0);
}

TEST(SampleEntropyReducer, RejectsMoreExtendedThanBaseMatches) {
    EXPECT_THROW(fastsampen::sample_entropy(2, 4), InvalidParameter);
}

TEST(SampleEntropyReducer, StatusNames) {
    EXPECT_EQ(std::string(fastsampen::status_name(SampEnStatus::Finite)), "finite");
    EXPECT_EQ(std::string(fastsampen::status_name(SampEnStatus::Infinite)), "infinite");
    EXPECT_EQ(std::string(fastsampen::status_name(SampEnStatus::Undefined)), "undefined");
}

TEST(SampleEntropy, RegularSeriesScoresLowerThanIrregular) {
    std::vector<double> periodic{1, 2, 3, 1, 2, 3, 1, 2, 3};
    std::vector<double> irregular{1, 3, 2, 1, 3, 3, 2, 1, 2};
    SampEnResult low = fastsampen::sample_entropy(periodic, 2, 0.5);
    SampEnResult high = fastsampen::sample_entropy(irregular, 2, 0.5);
    ASSERT_TRUE(low.is_finite());
    ASSERT_TRUE(high.is_finite());
    EXPECT_DOUBLE_EQ(low.value, std::log(10.0 / 6.0));
    EXPECT_DOUBLE_EQ(high.value, std::log(3.0));
    EXPECT_GT(high.value, 2.0 * low.value);
}

TEST(SampleEntropy, RegularSeriesScoresLowerThanPseudorandom) {
    std::vector<double> periodic{1, 2, 3, 1, 2, 3, 1, 2, 3};
    std::mt19937 gen(4);
    std::vector<double> noise(periodic.size());
    // same value range as the periodic series, from the raw engine output
    for (double& v : noise) v = 3.0 * static_cast<double>(gen() >> 8) / 16777216.0;

    SampEnResult low = fastsampen::sample_entropy(periodic, 2, 0.5);
    SampEnResult high = fastsampen::sample_entropy(noise, 2, 0.5);
    ASSERT_TRUE(low.is_finite());
    ASSERT_FALSE(high.is_undefined());
    EXPECT_GT(high.value, low.value);
    EXPECT_DOUBLE_EQ(high.value, std::log(3.0));
}

TEST(SampleEntropy, RandomSeriesIsReproducibleAcrossWorkers) {
    std::mt19937 gen(2024);
    std::vector<double> x(20);
    // raw engine output keeps the values identical on every standard library
    for (double& v : x) v = static_cast<double>(gen() >> 8) / 16777216.0;

    SampEnResult first = fastsampen::sample_entropy(x, 2, 0.2, 1);
    ASSERT_TRUE(first.is_finite());
    EXPECT_GT(first.value, 0.0);
    for (int k : {1, 2, 4, 8}) {
        SampEnResult again = fastsampen::sample_entropy(x, 2, 0.2, k);
        EXPECT_EQ(again.status, first.status);
        EXPECT_DOUBLE_EQ(again.value, first.value) << k << " workers";
    }
}

TEST(SampleEntropy, ShortestValidSeriesIsInfinite) {
    // N = m + 2: two length-m templates, one length-(m+1) template
    std::vector<double> x{5.0, 5.0, 5.0, 5.0};
    SampEnResult res = fastsampen::sample_entropy(x, 2, 0.1);
    EXPECT_TRUE(res.is_infinite());
}

TEST(SampleEntropy, NoMatchesIsUndefined) {
    std::vector<double> x{0, 10, 20, 30, 40};
    SampEnResult res = fastsampen::sample_entropy(x, 1, 1.0);
    EXPECT_TRUE(res.is_undefined());
    EXPECT_TRUE(std::isnan(res.value));
}

TEST(SampleEntropy, RejectsSeriesTooShortForEmbedding) {
    std::vector<double> x{1.0, 2.0, 3.0};
    EXPECT_THROW(fastsampen::sample_entropy(x, 2, 0.5), InvalidParameter);
    EXPECT_THROW(fastsampen::sample_entropy(x, 3, 0.5), InvalidParameter);
    EXPECT_THROW(fastsampen::sample_entropy(x, 0, 0.5), InvalidParameter);
    EXPECT_NO_THROW(fastsampen::sample_entropy(x, 1, 0.5));
}

TEST(SampleEntropy, RandomPropertiesHold) {
    std::mt19937 gen(99);
    std::normal_distribution<double> noise(0.0, 1.0);
    for (int trial = 0; trial < 50; ++trial) {
        std::vector<double> x(200);
        for (double& v : x) v = noise(gen);
        for (int m : {1, 2, 3}) {
            fastsampen::MatchCounts c = fastsampen::count_matches(x, m, 0.3, 4);
            EXPECT_LE(c.A, c.B);
            SampEnResult res = fastsampen::sample_entropy(c);
            if (c.B == 0) {
                EXPECT_TRUE(res.is_undefined());
            } else if (c.A == 0) {
                EXPECT_TRUE(res.is_infinite());
            } else {
                EXPECT_GE(res.value, 0.0);
            }
        }
    }
}
