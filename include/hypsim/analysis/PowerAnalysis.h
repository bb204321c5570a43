/**
    Repeated-testing analyses built on HypothesisTest
    - false-positive rate: generator embodies the null
    - power: generator embodies a true effect
    - false-negative rate: 1 - power, e.g. for data resampled from real observations

    Each experiment draws a fresh SampleGroup, builds a new test through the
    factory and estimates its p-value. Experiment i always uses stream i of the
    base generator, so serial and parallel runs give identical results.
*/

#ifndef HYPSIM_POWERANALYSIS_H
#define HYPSIM_POWERANALYSIS_H

#include <hypsim/analysis/GroupGenerator.h>
#include <hypsim/hypothesis/HypothesisTest.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

// ---- test construction ----

using TestFactory = std::function<std::unique_ptr<HypothesisTest>(const SampleGroup&,
                                                                  const RandomNumberGenerator&)>;

template <class Test>
TestFactory makeTestFactory()
{
    return [](const SampleGroup& data, const RandomNumberGenerator& rng) -> std::unique_ptr<HypothesisTest>
    {
        return std::make_unique<Test>(data, rng);
    };
}

// ---- options ----

struct ExperimentOptions {
    size_t numExperiments = 1000;
    size_t iterations = 1000;           // trials per experiment
    double significanceThreshold = 0.05;
    std::optional<uint64_t> randomSeed;
    bool parallel = false;              // OpenMP over experiments
    bool verbose = false;

    void validate() const; // throws std::invalid_argument
};

// ---- result struct ----

struct RateEstimate {
    double rate = 0.0;
    size_t numFlagged = 0;
    size_t numExperiments = 0;
    double stdError = 0.0;
    double ci95Lower = 0.0;  // Clopper-Pearson
    double ci95Upper = 1.0;
    std::vector<double> pValues; // one per experiment, in experiment order
};

// ---- analyses ----

// p-value of every experiment, in experiment order
std::vector<double> simulatePValues(const SampleGroupGenerator& generator,
                                    const TestFactory& factory,
                                    const ExperimentOptions& opts = {});

// fraction of experiments with p < threshold, generator draws identical distributions
RateEstimate estimateFalsePositiveRate(const SampleGroupGenerator& generator,
                                       const TestFactory& factory,
                                       const ExperimentOptions& opts = {});

// fraction of experiments with p < threshold, generator separated by a true effect
RateEstimate estimatePower(const SampleGroupGenerator& generator,
                           const TestFactory& factory,
                           const ExperimentOptions& opts = {});

// fraction of experiments with p >= threshold
RateEstimate estimateFalseNegativeRate(const SampleGroupGenerator& generator,
                                       const TestFactory& factory,
                                       const ExperimentOptions& opts = {});

#endif //HYPSIM_POWERANALYSIS_H
