#include <hypsim/data/SampleGroup.h>
#include <stdexcept>
#include <string>
#include <utility>

SampleGroup::SampleGroup(std::vector<Sample> samples)
    : _samples(std::move(samples))
{
}

SampleGroup::SampleGroup(Sample first, Sample second)
{
    _samples.reserve(2);
    _samples.push_back(std::move(first));
    _samples.push_back(std::move(second));
}

const Sample& SampleGroup::group(size_t i) const
{
    if (i >= _samples.size())
        throw std::out_of_range("SampleGroup::group: index " + std::to_string(i) +
                                " out of range for arity " + std::to_string(_samples.size()));
    return _samples[i];
}

std::vector<size_t> SampleGroup::sizes() const
{
    std::vector<size_t> result;
    result.reserve(_samples.size());
    for (const auto& s : _samples)
        result.push_back(s.size());
    return result;
}

size_t SampleGroup::totalSize() const
{
    size_t total = 0;
    for (const auto& s : _samples)
        total += s.size();
    return total;
}

Sample SampleGroup::pooled() const
{
    Sample pool;
    pool.reserve(totalSize());
    for (const auto& s : _samples)
        pool.insert(pool.end(), s.begin(), s.end());
    return pool;
}
