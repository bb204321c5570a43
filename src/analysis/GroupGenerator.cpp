#include <hypsim/analysis/GroupGenerator.h>
#include <hypsim/utils/Utils.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void checkSizes(const std::vector<size_t>& sizes, const char* who)
{
    if (sizes.empty())
        throw std::invalid_argument(std::string(who) + ": need at least one group");
    for (size_t n : sizes)
        if (n == 0)
            throw std::invalid_argument(std::string(who) + ": group sizes must be positive");
}

Sample resample(const Sample& source, size_t n, RandomNumberGenerator& rng)
{
    Sample out(n);
    for (size_t i = 0; i < n; ++i)
        out[i] = source[static_cast<size_t>(rng.uniformIndex(source.size()))];
    return out;
}

} // namespace

// ============================================================================
// NormalGroupGenerator
// ============================================================================

NormalGroupGenerator::NormalGroupGenerator(std::vector<size_t> sizes,
                                           std::vector<double> means,
                                           std::vector<double> stdDevs)
    : _sizes(std::move(sizes))
    , _means(std::move(means))
    , _stdDevs(std::move(stdDevs))
{
    checkSizes(_sizes, "NormalGroupGenerator");
    if (_means.size() != _sizes.size() || _stdDevs.size() != _sizes.size())
        throw std::invalid_argument("NormalGroupGenerator: sizes, means and stdDevs must have the same length");
    for (double sd : _stdDevs)
        if (!(sd >= 0.0))
            throw std::invalid_argument("NormalGroupGenerator: standard deviations must be non-negative");
    if (!Utils::allFinite(_means) || !Utils::allFinite(_stdDevs))
        throw std::invalid_argument("NormalGroupGenerator: parameters must be finite");
}

NormalGroupGenerator NormalGroupGenerator::nullPair(size_t n, size_t m, double mean, double stdDev)
{
    return NormalGroupGenerator({n, m}, {mean, mean}, {stdDev, stdDev});
}

NormalGroupGenerator NormalGroupGenerator::shiftedPair(size_t n, size_t m, double effectSize, double stdDev)
{
    return NormalGroupGenerator({n, m}, {0.0, effectSize}, {stdDev, stdDev});
}

NormalGroupGenerator* NormalGroupGenerator::clone() const
{
    return new NormalGroupGenerator(*this);
}

SampleGroup NormalGroupGenerator::generate(RandomNumberGenerator& rng) const
{
    std::vector<Sample> groups;
    groups.reserve(_sizes.size());
    for (size_t g = 0; g < _sizes.size(); ++g)
    {
        Sample s(_sizes[g]);
        for (double& x : s)
            x = rng.normal(_means[g], _stdDevs[g]);
        groups.push_back(std::move(s));
    }
    return SampleGroup(std::move(groups));
}

// ============================================================================
// ResamplingGroupGenerator
// ============================================================================

ResamplingGroupGenerator::ResamplingGroupGenerator(SampleGroup observed)
    : ResamplingGroupGenerator(observed, observed.sizes())
{
}

ResamplingGroupGenerator::ResamplingGroupGenerator(SampleGroup observed, std::vector<size_t> sizes)
    : _observed(std::move(observed))
    , _sizes(std::move(sizes))
{
    checkSizes(_sizes, "ResamplingGroupGenerator");
    if (_sizes.size() != _observed.arity())
        throw std::invalid_argument("ResamplingGroupGenerator: one size per observed group required");
    for (const auto& s : _observed.samples())
        if (s.empty())
            throw std::invalid_argument("ResamplingGroupGenerator: observed groups must be non-empty");
}

ResamplingGroupGenerator* ResamplingGroupGenerator::clone() const
{
    return new ResamplingGroupGenerator(*this);
}

SampleGroup ResamplingGroupGenerator::generate(RandomNumberGenerator& rng) const
{
    std::vector<Sample> groups;
    groups.reserve(_sizes.size());
    for (size_t g = 0; g < _sizes.size(); ++g)
        groups.push_back(resample(_observed[g], _sizes[g], rng));
    return SampleGroup(std::move(groups));
}

// ============================================================================
// PooledResamplingGenerator
// ============================================================================

PooledResamplingGenerator::PooledResamplingGenerator(const SampleGroup& observed)
    : PooledResamplingGenerator(observed, observed.sizes())
{
}

PooledResamplingGenerator::PooledResamplingGenerator(const SampleGroup& observed, std::vector<size_t> sizes)
    : _pool(observed.pooled())
    , _sizes(std::move(sizes))
{
    checkSizes(_sizes, "PooledResamplingGenerator");
    if (_pool.empty())
        throw std::invalid_argument("PooledResamplingGenerator: observed data is empty");
}

PooledResamplingGenerator* PooledResamplingGenerator::clone() const
{
    return new PooledResamplingGenerator(*this);
}

SampleGroup PooledResamplingGenerator::generate(RandomNumberGenerator& rng) const
{
    std::vector<Sample> groups;
    groups.reserve(_sizes.size());
    for (size_t n : _sizes)
        groups.push_back(resample(_pool, n, rng));
    return SampleGroup(std::move(groups));
}
