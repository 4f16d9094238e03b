#ifndef CALIBSET_PIPELINE_HPP
#define CALIBSET_PIPELINE_HPP

#include <cstddef>
#include <vector>

#include "calibset/Config.hpp"
#include "calibset/CorpusWriter.hpp"
#include "calibset/ImageNormalizer.hpp"
#include "calibset/Logger.hpp"
#include "calibset/Outcome.hpp"
#include "calibset/Sampler.hpp"
#include "calibset/StopToken.hpp"

namespace calib {

// collect -> sample -> (normalize + write, per item) -> manifest
class Pipeline {
public:
    Pipeline(const Config& config, Logger& logger, const StopToken* stop = nullptr);

    // Runs every stage. Per-item failures are tallied in the summary;
    // stage boundary failures propagate as CalibError subclasses.
    PipelineSummary run();

    const Config& config() const { return cfg; }

private:
    Config cfg;
    Logger& logger;
    const StopToken* stop;

    ItemOutcome processItem(std::size_t ordinal, const ImagePath& source,
                            const ImageNormalizer& normalizer,
                            const CorpusWriter& writer) const;

    std::vector<ItemOutcome> processAll(const SampleSet& samples,
                                        const ImageNormalizer& normalizer,
                                        const CorpusWriter& writer) const;

    bool stopRequested() const { return stop != nullptr && stop->stopRequested(); }
};

// 0 when at least one image was written, the manifest exists and the run
// was not interrupted; a dry run also counts as success. 1 otherwise.
int exitCodeFor(const PipelineSummary& summary);

void logSummary(Logger& logger, const PipelineSummary& summary);

} // namespace calib

#endif // CALIBSET_PIPELINE_HPP
