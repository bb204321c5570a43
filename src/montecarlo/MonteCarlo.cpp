#include <hypsim/montecarlo/MonteCarlo.h>
#include <boost/math/distributions/binomial.hpp>
#include <numeric>
#include <cmath>
#include <stdexcept>

MonteCarloResult MonteCarloResult::compute(const std::vector<double>& samples) {
    size_t n = samples.size();
    if (n == 0) return {};

    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    double mean = sum / static_cast<double>(n);
    if (n == 1) return {mean, 0.0, 0.0, mean, mean, n};

    double sqSum = 0.0;
    for (double s : samples) {
        sqSum += (s - mean) * (s - mean);
    }
    double variance = sqSum / static_cast<double>(n - 1);
    double stdError = std::sqrt(variance / static_cast<double>(n));

    double ci95Lower = mean - 1.96 * stdError;
    double ci95Upper = mean + 1.96 * stdError;

    return {mean, variance, stdError, ci95Lower, ci95Upper, n};
}

ProportionEstimate ProportionEstimate::compute(size_t successes, size_t trials) {
    if (trials == 0) {
        throw std::invalid_argument("ProportionEstimate: need at least one trial");
    }
    if (successes > trials) {
        throw std::invalid_argument("ProportionEstimate: successes exceed trials");
    }

    using boost::math::binomial_distribution;
    double n = static_cast<double>(trials);
    double k = static_cast<double>(successes);
    double p = k / n;

    ProportionEstimate est;
    est.proportion = p;
    est.successes = successes;
    est.trials = trials;
    est.stdError = std::sqrt(p * (1.0 - p) / n);
    // two-sided 95%: 2.5% in each tail
    est.ci95Lower = binomial_distribution<>::find_lower_bound_on_p(n, k, 0.025);
    est.ci95Upper = binomial_distribution<>::find_upper_bound_on_p(n, k, 0.025);
    return est;
}
