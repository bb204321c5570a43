#ifndef HYPSIM_GROUPGENERATOR_H
#define HYPSIM_GROUPGENERATOR_H

#include <hypsim/data/SampleGroup.h>
#include <hypsim/montecarlo/RandomNumberGenerator.h>
#include <vector>

/**
 * Produces fresh SampleGroups for repeated-testing experiments.
 * Whether the null holds is a property of the generator, not of the test.
 */
class SampleGroupGenerator
{
public:
    virtual ~SampleGroupGenerator() = default;
    virtual SampleGroupGenerator* clone() const = 0;

    virtual SampleGroup generate(RandomNumberGenerator& rng) const = 0;

    // sizes of the generated groups, in group order
    virtual std::vector<size_t> sizes() const = 0;
};

// ============================================================================
// Independent normal groups
// ============================================================================

class NormalGroupGenerator : public SampleGroupGenerator
{
public:
    NormalGroupGenerator(std::vector<size_t> sizes,
                         std::vector<double> means,
                         std::vector<double> stdDevs);

    // both groups ~ N(mean, sd²): the null holds by construction
    static NormalGroupGenerator nullPair(size_t n, size_t m, double mean = 0.0, double stdDev = 1.0);

    // N(0, sd²) vs N(effectSize, sd²)
    static NormalGroupGenerator shiftedPair(size_t n, size_t m, double effectSize, double stdDev = 1.0);

    NormalGroupGenerator* clone() const override;
    SampleGroup generate(RandomNumberGenerator& rng) const override;
    std::vector<size_t> sizes() const override { return _sizes; }

    const std::vector<double>& means() const { return _means; }
    const std::vector<double>& stdDevs() const { return _stdDevs; }

private:
    std::vector<size_t> _sizes;
    std::vector<double> _means;
    std::vector<double> _stdDevs;
};

// ============================================================================
// Bootstrap from observed data
// ============================================================================

/**
 * Resamples each observed group with replacement from itself,
 * so any real difference between the groups is kept.
 * Sizes default to the observed group sizes.
 */
class ResamplingGroupGenerator : public SampleGroupGenerator
{
public:
    explicit ResamplingGroupGenerator(SampleGroup observed);
    ResamplingGroupGenerator(SampleGroup observed, std::vector<size_t> sizes);

    ResamplingGroupGenerator* clone() const override;
    SampleGroup generate(RandomNumberGenerator& rng) const override;
    std::vector<size_t> sizes() const override { return _sizes; }

private:
    SampleGroup _observed;
    std::vector<size_t> _sizes;
};

/**
 * Resamples every group from the pooled observations: real data,
 * but no difference between groups.
 */
class PooledResamplingGenerator : public SampleGroupGenerator
{
public:
    explicit PooledResamplingGenerator(const SampleGroup& observed);
    PooledResamplingGenerator(const SampleGroup& observed, std::vector<size_t> sizes);

    PooledResamplingGenerator* clone() const override;
    SampleGroup generate(RandomNumberGenerator& rng) const override;
    std::vector<size_t> sizes() const override { return _sizes; }

private:
    Sample _pool;
    std::vector<size_t> _sizes;
};

#endif //HYPSIM_GROUPGENERATOR_H
