#ifndef CALIBSET_SAMPLER_HPP
#define CALIBSET_SAMPLER_HPP

#include <cstddef>
#include <cstdint>

#include "calibset/PathCollector.hpp"

namespace calib {

struct SampleSet {
    Corpus paths;                 // sorted by path string
    std::size_t corpus_size = 0;
    bool used_all = false;        // corpus was not larger than the request
};

// Seeded draw without replacement. The same corpus and seed always give
// the same SampleSet, which is what makes a calibration run reproducible.
class Sampler {
public:
    // Throws ValidationError when count <= 0.
    Sampler(int count, std::int64_t seed);

    SampleSet sample(const Corpus& corpus) const;

    int count() const { return requested; }
    std::int64_t seed() const { return rng_seed; }

private:
    int requested;
    std::int64_t rng_seed;
};

} // namespace calib

#endif // CALIBSET_SAMPLER_HPP
