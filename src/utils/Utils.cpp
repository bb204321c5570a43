#include <hypsim/utils/Utils.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

// ============================================================================
// * Normal distribution
// ============================================================================

// Standard normal CDF
double Utils::stdNormCdf(double x)
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double Utils::inverseNormalCDF(double u)
{
    /**
     * Moro's Inverse Normal CDF Algorithm (1995)
     *
     * Accuracy:
     * - Central region (0.08 < u < 0.92): |error| < 3×10⁻⁹
     * - Tail regions (u ≤ 0.08 or u ≥ 0.92): |error| < 10⁻⁷
     *
     * Reference: Moro, B. (1995), "The Full Monte", RISK, Vol. 8, No. 2
     */

    // Clamp to safe range to prevent log(0) or log(negative)
    const double eps = 1e-15;
    u = std::max(eps, std::min(u, 1.0 - eps));

    double x = u - 0.5;

    if (std::abs(x) < 0.42) {
        // Central region: |u - 0.5| < 0.42
        double r = x * x;

        static const double a0 =  2.50662823884;
        static const double a1 = -18.61500062529;
        static const double a2 =  41.39119773534;
        static const double a3 = -25.44106049637;

        static const double b0 = -8.47351093090;
        static const double b1 =  23.08336743743;
        static const double b2 = -21.06224101826;
        static const double b3 =   3.13082909833;

        double num = a0 + r * (a1 + r * (a2 + r * a3));
        double den = 1.0 + r * (b0 + r * (b1 + r * (b2 + r * b3)));

        return x * num / den;
    }

    // Tail regions: u ≤ 0.08 or u ≥ 0.92
    double r = (x < 0.0) ? u : (1.0 - u);
    r = std::log(-std::log(r));

    static const double c0 = 0.3374754822726147;
    static const double c1 = 0.9761690190917186;
    static const double c2 = 0.1607979714918209;
    static const double c3 = 0.0276438810333863;
    static const double c4 = 0.0038405729373609;
    static const double c5 = 0.0003951896511919;
    static const double c6 = 0.0000321767881768;
    static const double c7 = 0.0000002888167364;
    static const double c8 = 0.0000003960315187;

    double z = c0 + r * (c1 + r * (c2 + r * (c3 + r * (c4 +
               r * (c5 + r * (c6 + r * (c7 + r * c8)))))));

    return (x < 0.0) ? -z : z;
}

// ============================================================================
// * Descriptive statistics
// ============================================================================

double Utils::mean(const std::vector<double>& values)
{
    if (values.empty()) {
        throw std::invalid_argument("Utils::mean: empty input");
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double Utils::variance(const std::vector<double>& values, size_t ddof)
{
    size_t n = values.size();
    if (n == 0 || n <= ddof) {
        throw std::invalid_argument("Utils::variance: need more than ddof observations");
    }
    double m = mean(values);
    double sqSum = 0.0;
    for (double v : values) {
        sqSum += (v - m) * (v - m);
    }
    return sqSum / static_cast<double>(n - ddof);
}

double Utils::stdDev(const std::vector<double>& values, size_t ddof)
{
    return std::sqrt(variance(values, ddof));
}

double Utils::correlation(const std::vector<double>& xs, const std::vector<double>& ys)
{
    if (xs.size() != ys.size()) {
        throw std::invalid_argument("Utils::correlation: series must have the same length");
    }
    size_t n = xs.size();
    if (n < 2) {
        throw std::invalid_argument("Utils::correlation: need at least 2 pairs");
    }

    double meanX = mean(xs);
    double meanY = mean(ys);
    double cov = 0.0, varX = 0.0, varY = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = xs[i] - meanX;
        double dy = ys[i] - meanY;
        cov += dx * dy;
        varX += dx * dx;
        varY += dy * dy;
    }

    if (varX <= 0.0 || varY <= 0.0) {
        throw std::invalid_argument("Utils::correlation: constant series has no correlation");
    }
    return cov / std::sqrt(varX * varY);
}

bool Utils::allFinite(const std::vector<double>& values)
{
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return std::isfinite(v); });
}
