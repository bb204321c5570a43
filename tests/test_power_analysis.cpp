//
// Tests for the sample generators and the repeated-testing analyses
//

#include <gtest/gtest.h>
#include <hypsim/analysis/GroupGenerator.h>
#include <hypsim/analysis/PowerAnalysis.h>
#include <hypsim/hypothesis/PermutationTests.h>
#include <hypsim/utils/Errors.h>
#include <hypsim/utils/Utils.h>
#include "test_utils.h"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

using testutils::sorted;

namespace {

ExperimentOptions quickOptions(size_t experiments, size_t iterations, uint64_t seed)
{
    ExperimentOptions opts;
    opts.numExperiments = experiments;
    opts.iterations = iterations;
    opts.randomSeed = seed;
    return opts;
}

} // namespace

// ---------------------------------------------------------------
// generators
// ---------------------------------------------------------------

TEST(GroupGeneratorTest, NormalGeneratorShapesAndMoments)
{
    auto gen = NormalGroupGenerator::shiftedPair(4000, 3000, 2.0, 1.5);
    PCG32Generator rng(1);
    SampleGroup g = gen.generate(rng);

    EXPECT_EQ(g.sizes(), (std::vector<size_t>{4000, 3000}));
    EXPECT_EQ(gen.sizes(), g.sizes());
    EXPECT_NEAR(Utils::mean(g[0]), 0.0, 0.1);
    EXPECT_NEAR(Utils::mean(g[1]), 2.0, 0.1);
    EXPECT_NEAR(Utils::stdDev(g[1]), 1.5, 0.1);
}

TEST(GroupGeneratorTest, NormalGeneratorValidation)
{
    EXPECT_THROW(NormalGroupGenerator({10, 10}, {0.0}, {1.0, 1.0}), std::invalid_argument);
    EXPECT_THROW(NormalGroupGenerator({10, 0}, {0.0, 0.0}, {1.0, 1.0}), std::invalid_argument);
    EXPECT_THROW(NormalGroupGenerator({10}, {0.0}, {-1.0}), std::invalid_argument);
    EXPECT_THROW(NormalGroupGenerator({}, {}, {}), std::invalid_argument);
}

TEST(GroupGeneratorTest, ResamplingDrawsFromOwnGroup)
{
    SampleGroup observed({1.0, 2.0, 3.0}, {10.0, 20.0});
    ResamplingGroupGenerator gen(observed, {50, 40});
    PCG32Generator rng(2);
    SampleGroup g = gen.generate(rng);

    ASSERT_EQ(g.sizes(), (std::vector<size_t>{50, 40}));
    for (double v : g[0])
        EXPECT_TRUE(v >= 1.0 && v <= 3.0);
    for (double v : g[1])
        EXPECT_TRUE(v == 10.0 || v == 20.0);

    EXPECT_EQ(ResamplingGroupGenerator(observed).sizes(), observed.sizes());
    EXPECT_THROW(ResamplingGroupGenerator(observed, {5}), std::invalid_argument);
    EXPECT_THROW(ResamplingGroupGenerator(SampleGroup({}, {1.0})), std::invalid_argument);
}

TEST(GroupGeneratorTest, PooledResamplingMixesGroups)
{
    SampleGroup observed({1.0, 1.0, 1.0}, {2.0, 2.0, 2.0});
    PooledResamplingGenerator gen(observed);
    PCG32Generator rng(3);

    bool mixed = false;
    for (int i = 0; i < 20 && !mixed; ++i)
    {
        SampleGroup g = gen.generate(rng);
        ASSERT_EQ(g.sizes(), observed.sizes());
        Sample first = sorted(g[0]);
        mixed = first.front() != first.back();
    }
    EXPECT_TRUE(mixed);
}

TEST(GroupGeneratorTest, CloneGeneratesSameData)
{
    auto gen = NormalGroupGenerator::nullPair(10, 12);
    std::unique_ptr<SampleGroupGenerator> copy(gen.clone());
    PCG32Generator a(4), b(4);
    EXPECT_EQ(gen.generate(a), copy->generate(b));
}

// ---------------------------------------------------------------
// false positive rate
// ---------------------------------------------------------------

TEST(PowerAnalysisTest, FalsePositiveRateMatchesThreshold)
{
    auto gen = NormalGroupGenerator::nullPair(20, 20);
    RateEstimate fpr = estimateFalsePositiveRate(gen, makeTestFactory<DiffMeansPermute>(),
                                                 quickOptions(1000, 200, 2024));

    EXPECT_EQ(fpr.numExperiments, 1000u);
    EXPECT_EQ(fpr.pValues.size(), 1000u);
    EXPECT_GE(fpr.rate, 0.03);
    EXPECT_LE(fpr.rate, 0.08);
    EXPECT_LE(fpr.ci95Lower, fpr.rate);
    EXPECT_GE(fpr.ci95Upper, fpr.rate);
}

TEST(PowerAnalysisTest, FalsePositiveRateFromPooledRealData)
{
    SampleGroup observed = testutils::normalPair(40, 0.0, 40, 1.0, 8);
    RateEstimate fpr = estimateFalsePositiveRate(PooledResamplingGenerator(observed),
                                                 makeTestFactory<DiffMeansPermute>(),
                                                 quickOptions(400, 200, 9));
    EXPECT_LE(fpr.rate, 0.1);
}

// ---------------------------------------------------------------
// power
// ---------------------------------------------------------------

TEST(PowerAnalysisTest, PowerIncreasesWithEffectSize)
{
    std::vector<double> power;
    for (double effect : {0.0, 0.5, 1.0})
    {
        auto gen = NormalGroupGenerator::shiftedPair(20, 20, effect);
        power.push_back(estimatePower(gen, makeTestFactory<DiffMeansPermute>(),
                                      quickOptions(200, 200, 77)).rate);
    }

    EXPECT_LE(power[0], power[1]);
    EXPECT_LE(power[1], power[2]);
    EXPECT_LT(power[0], 0.12);
    EXPECT_GT(power[2], 0.7);
}

TEST(PowerAnalysisTest, PowerIncreasesWithSampleSize)
{
    std::vector<double> power;
    for (size_t n : {10, 40, 80})
    {
        auto gen = NormalGroupGenerator::shiftedPair(n, n, 0.5);
        power.push_back(estimatePower(gen, makeTestFactory<DiffMeansPermute>(),
                                      quickOptions(200, 200, 78)).rate);
    }

    EXPECT_LE(power[0], power[1]);
    EXPECT_LE(power[1], power[2]);
    EXPECT_GT(power[2], 0.7);
}

TEST(PowerAnalysisTest, FalseNegativeRateComplementsPower)
{
    auto gen = NormalGroupGenerator::shiftedPair(15, 15, 0.8);
    auto opts = quickOptions(150, 100, 5);
    RateEstimate power = estimatePower(gen, makeTestFactory<DiffMeansPermute>(), opts);
    RateEstimate fnr = estimateFalseNegativeRate(gen, makeTestFactory<DiffMeansPermute>(), opts);

    EXPECT_EQ(power.pValues, fnr.pValues);
    EXPECT_EQ(power.numFlagged + fnr.numFlagged, opts.numExperiments);
    EXPECT_NEAR(power.rate + fnr.rate, 1.0, 1e-12);
}

// ---------------------------------------------------------------
// reproducibility and parallelism
// ---------------------------------------------------------------

TEST(PowerAnalysisTest, SeededRunsAreReproducible)
{
    auto gen = NormalGroupGenerator::shiftedPair(10, 10, 0.3);
    auto opts = quickOptions(50, 100, 12);
    EXPECT_EQ(simulatePValues(gen, makeTestFactory<DiffStdPermute>(), opts),
              simulatePValues(gen, makeTestFactory<DiffStdPermute>(), opts));
}

TEST(PowerAnalysisTest, ParallelMatchesSerial)
{
    auto gen = NormalGroupGenerator::shiftedPair(12, 14, 0.4);
    auto serial = quickOptions(64, 100, 33);
    auto parallel = serial;
    parallel.parallel = true;

    EXPECT_EQ(simulatePValues(gen, makeTestFactory<DiffMeansPermute>(), serial),
              simulatePValues(gen, makeTestFactory<DiffMeansPermute>(), parallel));
}

// ---------------------------------------------------------------
// errors
// ---------------------------------------------------------------

TEST(PowerAnalysisTest, InvalidOptionsRejected)
{
    auto gen = NormalGroupGenerator::nullPair(5, 5);
    auto factory = makeTestFactory<DiffMeansPermute>();

    ExperimentOptions none = quickOptions(0, 10, 1);
    EXPECT_THROW(estimatePower(gen, factory, none), std::invalid_argument);

    ExperimentOptions noIterations = quickOptions(10, 0, 1);
    EXPECT_THROW(estimatePower(gen, factory, noIterations), std::invalid_argument);

    ExperimentOptions badThreshold = quickOptions(10, 10, 1);
    badThreshold.significanceThreshold = 1.5;
    EXPECT_THROW(estimatePower(gen, factory, badThreshold), std::invalid_argument);

    EXPECT_THROW(estimatePower(gen, TestFactory{}, quickOptions(10, 10, 1)), std::invalid_argument);
}

TEST(PowerAnalysisTest, ExperimentErrorsPropagate)
{
    // three groups cannot feed a two-group test
    NormalGroupGenerator gen({5, 5, 5}, {0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
    auto opts = quickOptions(8, 10, 1);
    EXPECT_THROW(estimateFalsePositiveRate(gen, makeTestFactory<DiffMeansPermute>(), opts),
                 InvalidDataError);

    opts.parallel = true;
    EXPECT_THROW(estimateFalsePositiveRate(gen, makeTestFactory<DiffMeansPermute>(), opts),
                 InvalidDataError);

    TestFactory nullFactory = [](const SampleGroup&, const RandomNumberGenerator&)
    { return std::unique_ptr<HypothesisTest>(); };
    EXPECT_THROW(simulatePValues(NormalGroupGenerator::nullPair(5, 5), nullFactory, quickOptions(4, 10, 1)),
                 std::invalid_argument);
}
