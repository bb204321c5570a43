#include <hypsim/analysis/GroupGenerator.h>
#include <hypsim/analysis/PowerAnalysis.h>
#include <hypsim/hypothesis/PermutationTests.h>
#include <hypsim/montecarlo/RandomNumberGenerator.h>

#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>

// whitespace separated numbers, one sample per file
Sample readSample(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open " + path);
    Sample values;
    double x;
    while (in >> x)
        values.push_back(x);
    if (!in.eof())
        throw std::runtime_error("non-numeric value in " + path);
    return values;
}

int main(int argc, char** argv)
{
    const uint64_t seed = 17;

    SampleGroup data;
    try
    {
        if (argc >= 3)
        {
            data = SampleGroup(readSample(argv[1]), readSample(argv[2]));
        }
        else
        {
            // no input files: two synthetic groups with a small true difference
            std::cout << "usage: " << argv[0] << " <group1.txt> <group2.txt>  (using synthetic data)\n";
            PCG32Generator rng(seed);
            data = NormalGroupGenerator({400, 450}, {38.6, 38.5}, {2.7, 2.7}).generate(rng);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    TestOptions opts;
    opts.iterations = 1000;
    opts.randomSeed = seed;
    opts.verbose = true;

    try
    {
        std::cout << "\nDifference in means (permutation)" << std::endl;
        DiffMeansPermute means(data, seed);
        TestResult r = means.run(opts);

        std::cout << "\nDifference in means (one-sided)" << std::endl;
        DiffMeansOneSided oneSided(data, seed);
        oneSided.run(opts);

        std::cout << "\nDifference in standard deviations" << std::endl;
        DiffStdPermute stds(data, seed);
        stds.run(opts);

        std::cout << "\nDifference in means (pooled resampling)" << std::endl;
        DiffMeansResample resample(data, seed);
        resample.run(opts);

        MonteCarloResult null = means.trialSummary();
        std::cout << "\nnull distribution of |diff means|: mean = " << null.mean
                  << ", 95% CI [" << null.ci95Lower << ", " << null.ci95Upper << "]"
                  << ", observed = " << r.actual << std::endl;

        // how often would the observed data fool us?
        ExperimentOptions expOpts;
        expOpts.numExperiments = 200;
        expOpts.iterations = 200;
        expOpts.randomSeed = seed;
        expOpts.parallel = true;

        std::cout << "\nRepeated testing" << std::endl;
        RateEstimate fpr = estimateFalsePositiveRate(PooledResamplingGenerator(data),
                                                     makeTestFactory<DiffMeansPermute>(), expOpts);
        RateEstimate fnr = estimateFalseNegativeRate(ResamplingGroupGenerator(data),
                                                     makeTestFactory<DiffMeansPermute>(), expOpts);
        std::cout << "false positive rate (pooled resampling): " << fpr.rate << "\n"
                  << "false negative rate (group resampling):  " << fnr.rate << std::endl;

        // smallest sample size reaching 80% power for a 0.5 sd effect
        std::cout << "\nPower vs sample size (effect size 0.5 sd)" << std::endl;
        const double targetPower = 0.8;
        for (size_t n : {10, 20, 40, 60, 80, 100})
        {
            RateEstimate power = estimatePower(NormalGroupGenerator::shiftedPair(n, n, 0.5),
                                               makeTestFactory<DiffMeansPermute>(), expOpts);
            std::cout << "  n = " << std::setw(4) << n << "  power = " << std::fixed
                      << std::setprecision(3) << power.rate << std::defaultfloat << std::endl;
            if (power.rate >= targetPower)
            {
                std::cout << "  reached " << targetPower << " power at n = " << n << std::endl;
                break;
            }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
