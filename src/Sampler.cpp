#include "calibset/Sampler.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "calibset/Errors.hpp"
#include "calibset/utils.hpp"

namespace calib {

Sampler::Sampler(int count, std::int64_t seed) : requested(count), rng_seed(seed) {
    if (count <= 0) {
        throw ValidationError("Number of images must be positive, got " + std::to_string(count));
    }
    if (count > Utils::kMaxImages) {
        throw ValidationError("Number of images must be at most " + std::to_string(Utils::kMaxImages) +
                              ", got " + std::to_string(count));
    }
}

// cv::RNG is a fixed multiply-with-carry generator, so the seed -> selection
// mapping does not depend on the standard library in use.
// Partial Fisher-Yates over indices: the first `requested` slots are the draw.
// The result is re-sorted by path; draw order never reaches the ordinals.
SampleSet Sampler::sample(const Corpus& corpus) const {
    SampleSet result;
    result.corpus_size = corpus.size();

    const std::size_t n = static_cast<std::size_t>(requested);
    if (corpus.size() <= n) {
        result.paths = corpus;
        result.used_all = true;
    } else {
        std::vector<std::size_t> indices(corpus.size());
        std::iota(indices.begin(), indices.end(), std::size_t{0});

        cv::RNG rng(static_cast<std::uint64_t>(rng_seed));
        for (std::size_t i = 0; i < n; ++i) {
            const int remaining = static_cast<int>(corpus.size() - i);
            const std::size_t j = i + static_cast<std::size_t>(rng.uniform(0, remaining));
            std::swap(indices[i], indices[j]);
        }

        result.paths.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            result.paths.push_back(corpus[indices[i]]);
        }
        std::sort(result.paths.begin(), result.paths.end(),
                  [](const ImagePath& a, const ImagePath& b) { return a.string() < b.string(); });
    }
    return result;
}

} // namespace calib
