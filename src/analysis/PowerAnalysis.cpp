#include <hypsim/analysis/PowerAnalysis.h>
#include <hypsim/montecarlo/MonteCarlo.h>
#include <algorithm>
#include <exception>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <utility>

void ExperimentOptions::validate() const
{
    if (numExperiments == 0)
        throw std::invalid_argument("ExperimentOptions: numExperiments must be positive");
    if (iterations == 0)
        throw std::invalid_argument("ExperimentOptions: iterations must be positive");
    if (!(significanceThreshold > 0.0 && significanceThreshold < 1.0))
        throw std::invalid_argument("ExperimentOptions: significanceThreshold must lie in (0, 1)");
}

namespace {

RateEstimate countFlagged(std::vector<double> pValues, double threshold, bool flagSignificant,
                          bool verbose, const char* label)
{
    size_t flagged = std::count_if(pValues.begin(), pValues.end(), [&](double p)
                                   { return flagSignificant ? p < threshold : p >= threshold; });

    ProportionEstimate est = ProportionEstimate::compute(flagged, pValues.size());

    RateEstimate result;
    result.rate = est.proportion;
    result.numFlagged = est.successes;
    result.numExperiments = est.trials;
    result.stdError = est.stdError;
    result.ci95Lower = est.ci95Lower;
    result.ci95Upper = est.ci95Upper;
    result.pValues = std::move(pValues);

    if (verbose)
        std::cout << label << " = " << std::fixed << std::setprecision(4) << result.rate
                  << " (" << result.numFlagged << "/" << result.numExperiments
                  << ", 95% CI [" << result.ci95Lower << ", " << result.ci95Upper << "])\n"
                  << std::defaultfloat;

    return result;
}

} // namespace

std::vector<double> simulatePValues(const SampleGroupGenerator& generator,
                                    const TestFactory& factory,
                                    const ExperimentOptions& opts)
{
    opts.validate();
    if (!factory)
        throw std::invalid_argument("simulatePValues: empty test factory");

    const size_t n = opts.numExperiments;
    auto base = makeGenerator(opts.randomSeed);
    auto streams = base->createParallelStreams(n);

    std::vector<double> pValues(n, 1.0);
    std::exception_ptr error;
    const size_t progressStep = std::max<size_t>(1, n / 10);

    // each experiment owns its stream, its data and its test: no shared mutable state
#pragma omp parallel for schedule(dynamic) if (opts.parallel)
    for (long long i = 0; i < static_cast<long long>(n); ++i)
    {
        try
        {
            RandomNumberGenerator& rng = *streams[static_cast<size_t>(i)];
            SampleGroup data = generator.generate(rng);
            std::unique_ptr<HypothesisTest> test = factory(data, rng);
            if (!test)
                throw std::invalid_argument("simulatePValues: test factory returned null");
            pValues[static_cast<size_t>(i)] = test->pValue(opts.iterations);

            if (opts.verbose && !opts.parallel && (static_cast<size_t>(i) + 1) % progressStep == 0)
                std::cout << "experiment " << (i + 1) << "/" << n << "\n";
        }
        catch (...)
        {
#pragma omp critical
            {
                if (!error)
                    error = std::current_exception();
            }
        }
    }

    if (error)
        std::rethrow_exception(error);
    return pValues;
}

RateEstimate estimateFalsePositiveRate(const SampleGroupGenerator& generator,
                                       const TestFactory& factory,
                                       const ExperimentOptions& opts)
{
    return countFlagged(simulatePValues(generator, factory, opts),
                        opts.significanceThreshold, true, opts.verbose, "false positive rate");
}

RateEstimate estimatePower(const SampleGroupGenerator& generator,
                           const TestFactory& factory,
                           const ExperimentOptions& opts)
{
    return countFlagged(simulatePValues(generator, factory, opts),
                        opts.significanceThreshold, true, opts.verbose, "power");
}

RateEstimate estimateFalseNegativeRate(const SampleGroupGenerator& generator,
                                       const TestFactory& factory,
                                       const ExperimentOptions& opts)
{
    return countFlagged(simulatePValues(generator, factory, opts),
                        opts.significanceThreshold, false, opts.verbose, "false negative rate");
}
