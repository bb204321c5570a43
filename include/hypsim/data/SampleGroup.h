#ifndef HYPSIM_SAMPLEGROUP_H
#define HYPSIM_SAMPLEGROUP_H

#include <vector>
#include <cstddef>

using Sample = std::vector<double>; // observations of one group, in order

/**
 * Fixed-arity tuple of samples under comparison (commonly 2).
 * Plain data holder: the hypothesis test that captures it does the validation.
 */
class SampleGroup
{
public:
    SampleGroup() = default;
    explicit SampleGroup(std::vector<Sample> samples);
    SampleGroup(Sample first, Sample second);

    size_t arity() const { return _samples.size(); }

    // range checked, throws std::out_of_range
    const Sample& group(size_t i) const;
    const Sample& operator[](size_t i) const { return group(i); }

    const std::vector<Sample>& samples() const { return _samples; }

    std::vector<size_t> sizes() const;
    size_t totalSize() const;

    // concatenation of all groups in group order
    Sample pooled() const;

    bool operator==(const SampleGroup& other) const { return _samples == other._samples; }
    bool operator!=(const SampleGroup& other) const { return !(*this == other); }

private:
    std::vector<Sample> _samples;
};

#endif //HYPSIM_SAMPLEGROUP_H
