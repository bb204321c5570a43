#ifndef HYPSIM_RANDOMNUMBERGENERATOR_H
#define HYPSIM_RANDOMNUMBERGENERATOR_H


#include <pcg_random.hpp>
#include <hypsim/utils/Utils.h>
#include <random>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>


// ============================================================================
// BASE CLASS
// ============================================================================

class RandomNumberGenerator {
public:
    virtual ~RandomNumberGenerator() = default;
    virtual RandomNumberGenerator* clone() const = 0;

    // sampling
    virtual double uniform() = 0;
    virtual uint64_t uniformIndex(uint64_t n) = 0; // uniform integer in [0, n)
    double normal();
    double normal(double mean, double stdDev);

    // in-place Fisher-Yates driven by uniformIndex
    void shuffle(std::vector<double>& values);

    // seeding
    virtual void seed(uint64_t s) = 0;

    // state management (replay the same stream on every p-value run)
    virtual void saveState() = 0;
    virtual void restoreState() = 0;

    // parallel streams
    virtual std::vector<std::unique_ptr<RandomNumberGenerator>>
        createParallelStreams(size_t n) const = 0;

protected:
    RandomNumberGenerator() = default;
};

// ============================================================================
// PCG32 GENERATOR
// ============================================================================

class PCG32Generator : public RandomNumberGenerator {
public:
    explicit PCG32Generator(uint64_t seed, uint64_t stream = 0);
    PCG32Generator* clone() const override;

    double uniform() override;
    uint64_t uniformIndex(uint64_t n) override;
    void seed(uint64_t s) override;
    void saveState() override;
    void restoreState() override;

    std::vector<std::unique_ptr<RandomNumberGenerator>>
        createParallelStreams(size_t n) const override;

private:
    pcg32 _rng;
    pcg32 _savedState;
    uint64_t _seed;
    uint64_t _stream;
};

// ============================================================================
// MERSENNE TWISTER GENERATOR
// ============================================================================

class MersenneTwisterGenerator : public RandomNumberGenerator {
public:
    explicit MersenneTwisterGenerator(uint64_t seed);
    MersenneTwisterGenerator* clone() const override;

    double uniform() override;
    uint64_t uniformIndex(uint64_t n) override;
    void seed(uint64_t s) override;
    void saveState() override;
    void restoreState() override;

    std::vector<std::unique_ptr<RandomNumberGenerator>>
        createParallelStreams(size_t n) const override;

private:
    std::mt19937_64 _rng;
    std::mt19937_64 _savedState;
    uint64_t _seed;
};

// PCG32 seeded with `seed`, or from std::random_device when no seed is given
std::unique_ptr<RandomNumberGenerator> makeGenerator(std::optional<uint64_t> seed = std::nullopt);

// ============================================================================
// INLINE IMPLEMENTATIONS
// ============================================================================

inline double RandomNumberGenerator::normal() {
    return Utils::inverseNormalCDF(uniform());
}

inline double RandomNumberGenerator::normal(double mean, double stdDev) {
    return mean + stdDev * normal();
}

#endif // HYPSIM_RANDOMNUMBERGENERATOR_H
