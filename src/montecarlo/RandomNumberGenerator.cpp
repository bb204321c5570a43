#include <hypsim/montecarlo/RandomNumberGenerator.h>
#include <boost/random/uniform_int_distribution.hpp>
#include <stdexcept>
#include <utility>

// ============================================================================
// BASE CLASS
// ============================================================================

void RandomNumberGenerator::shuffle(std::vector<double>& values) {
    for (size_t i = values.size(); i > 1; --i) {
        size_t j = static_cast<size_t>(uniformIndex(i));
        std::swap(values[i - 1], values[j]);
    }
}

std::unique_ptr<RandomNumberGenerator> makeGenerator(std::optional<uint64_t> seed) {
    if (seed) {
        return std::make_unique<PCG32Generator>(*seed);
    }
    std::random_device rd;
    uint64_t s = (static_cast<uint64_t>(rd()) << 32) | rd();
    return std::make_unique<PCG32Generator>(s);
}

// ============================================================================
// PCG32 GENERATOR
// ============================================================================

PCG32Generator::PCG32Generator(uint64_t seed, uint64_t stream)
    : _rng(seed, stream)
    , _savedState(seed, stream)
    , _seed(seed)
    , _stream(stream)
{}

PCG32Generator* PCG32Generator::clone() const {
    return new PCG32Generator(*this);
}

double PCG32Generator::uniform() {
    return std::generate_canonical<double, 53>(_rng);
}

uint64_t PCG32Generator::uniformIndex(uint64_t n) {
    if (n == 0) {
        throw std::invalid_argument("uniformIndex: range must be non-empty");
    }
    // boost distributions give the same sequence on every platform
    boost::random::uniform_int_distribution<uint64_t> dist(0, n - 1);
    return dist(_rng);
}

void PCG32Generator::seed(uint64_t s) {
    _seed = s;
    _rng.seed(s, _stream);
}

void PCG32Generator::saveState() {
    _savedState = _rng;
}

void PCG32Generator::restoreState() {
    _rng = _savedState;
}

std::vector<std::unique_ptr<RandomNumberGenerator>>
PCG32Generator::createParallelStreams(size_t n) const {
    std::vector<std::unique_ptr<RandomNumberGenerator>> streams;
    streams.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        // same seed, different stream per experiment
        streams.push_back(std::make_unique<PCG32Generator>(_seed, _stream + i + 1));
    }
    return streams;
}

// ============================================================================
// MERSENNE TWISTER GENERATOR
// ============================================================================

MersenneTwisterGenerator::MersenneTwisterGenerator(uint64_t seed)
    : _rng(seed)
    , _savedState(seed)
    , _seed(seed)
{}

MersenneTwisterGenerator* MersenneTwisterGenerator::clone() const {
    return new MersenneTwisterGenerator(*this);
}

double MersenneTwisterGenerator::uniform() {
    return std::generate_canonical<double, 53>(_rng);
}

uint64_t MersenneTwisterGenerator::uniformIndex(uint64_t n) {
    if (n == 0) {
        throw std::invalid_argument("uniformIndex: range must be non-empty");
    }
    boost::random::uniform_int_distribution<uint64_t> dist(0, n - 1);
    return dist(_rng);
}

void MersenneTwisterGenerator::seed(uint64_t s) {
    _seed = s;
    _rng.seed(s);
}

void MersenneTwisterGenerator::saveState() {
    _savedState = _rng;
}

void MersenneTwisterGenerator::restoreState() {
    _rng = _savedState;
}

std::vector<std::unique_ptr<RandomNumberGenerator>>
MersenneTwisterGenerator::createParallelStreams(size_t n) const {
    std::vector<std::unique_ptr<RandomNumberGenerator>> streams;
    streams.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        // each stream gets a different seed offset
        streams.push_back(std::make_unique<MersenneTwisterGenerator>(_seed + i + 1));
    }
    return streams;
}
