/** 
    Summaries of Monte Carlo output:
    - MonteCarloResult: mean / std error / 95% CI of simulated values
    - ProportionEstimate: fraction of successful trials with exact binomial CI
*/


#ifndef HYPSIM_MONTECARLO_MONTECARLO_H
#define HYPSIM_MONTECARLO_MONTECARLO_H

#include <vector>
#include <cstddef>

struct MonteCarloResult {
    double mean = 0.0;
    double variance = 0.0;
    double stdError = 0.0;
    double ci95Lower = 0.0;
    double ci95Upper = 0.0;
    size_t numSamples = 0;

    static MonteCarloResult compute(const std::vector<double>& samples);
};

struct ProportionEstimate {
    double proportion = 0.0;
    size_t successes = 0;
    size_t trials = 0;
    double stdError = 0.0;   // sqrt(p(1-p)/n)
    double ci95Lower = 0.0;  // Clopper-Pearson
    double ci95Upper = 1.0;

    static ProportionEstimate compute(size_t successes, size_t trials);
};

#endif
