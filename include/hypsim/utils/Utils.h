#ifndef HYPSIM_UTILS_H
#define HYPSIM_UTILS_H

#include <vector>
#include <cstddef>


/**
 *  NOTES:
 *  (1) Descriptive statistics use the population estimator by default (ddof = 0);
 *      pass ddof = 1 for the unbiased sample estimator.
 *  (2) All summary functions throw std::invalid_argument on empty input, and the
 *      moment functions when n <= ddof.
 */


class Utils
{
public:
    // static method = class method and not an object/instance method!
    static double stdNormCdf(double x);

    /** Moro's Inverse Normal CDF Algorithm
     * Inverse of the standard normal CDF: Φ^(-1)(u)
     *
     * @param u Uniform random variable in (0, 1)
     * @return Standard normal random variable Z ~ N(0,1)
     */
    static double inverseNormalCDF(double u);

    static double mean(const std::vector<double>& values);

    /**
     * Central second moment with a degrees-of-freedom correction
     * var = Σ(x - x̄)² / (n - ddof)
     */
    static double variance(const std::vector<double>& values, size_t ddof = 0);

    static double stdDev(const std::vector<double>& values, size_t ddof = 0);

    /**
     * Pearson correlation coefficient of paired series
     * @throws std::invalid_argument on size mismatch, fewer than 2 pairs or a constant series
     */
    static double correlation(const std::vector<double>& xs, const std::vector<double>& ys);

    // true if every value is finite (no NaN / ±inf)
    static bool allFinite(const std::vector<double>& values);

private:
    Utils() = delete; // delete constructor; everything is static
};

#endif //HYPSIM_UTILS_H
