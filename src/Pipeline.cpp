#include "calibset/Pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>

#include "calibset/Errors.hpp"
#include "calibset/ManifestGenerator.hpp"
#include "calibset/PathCollector.hpp"
#include "calibset/Profiler.hpp"
#include "calibset/utils.hpp"

namespace calib {

Pipeline::Pipeline(const Config& config, Logger& logger, const StopToken* stop)
    : cfg(config), logger(logger), stop(stop) {}

// Decode -> resize -> encode -> write for one sample.
// The ordinal is the sample's index in the sorted SampleSet and is fixed
// before the item is handed to a worker.
ItemOutcome Pipeline::processItem(std::size_t ordinal, const ImagePath& source,
                                  const ImageNormalizer& normalizer,
                                  const CorpusWriter& writer) const {
    ItemOutcome outcome;
    NormalizeResult normalized = normalizer.normalize(source);
    if (!normalized.ok) {
        outcome.ordinal = ordinal;
        outcome.source = source;
        outcome.output = writer.outputPathFor(ordinal);
        outcome.status = ItemStatus::DecodeFailure;
        outcome.message = normalized.error;
        logger.warning("Failed to decode image: " + source.string() + " (" + normalized.error + ")");
        return outcome;
    }

    outcome = writer.write(ordinal, normalized.normalized.img);
    outcome.source = source;
    if (outcome.ok()) {
        std::ostringstream oss;
        oss << "Saved " << outcome.output.string() << " from " << source.string();
        if (normalized.normalized.resized) {
            oss << " (resized " << normalized.normalized.source_width << "x"
                << normalized.normalized.source_height << ")";
        }
        logger.debug(oss.str());
    } else {
        logger.warning("Failed to save " + outcome.output.string() + " (" +
                       toString(outcome.status) + ": " + outcome.message + ")");
    }
    return outcome;
}

// Items are claimed through a shared atomic index. Each worker writes only
// the outcome slot of the index it claimed, so the vector needs no lock and
// the tally is done by the caller after every worker has joined.
// A stop request ends the claiming; items already in flight finish.
std::vector<ItemOutcome> Pipeline::processAll(const SampleSet& samples,
                                              const ImageNormalizer& normalizer,
                                              const CorpusWriter& writer) const {
    const std::size_t total = samples.paths.size();
    std::vector<ItemOutcome> outcomes(total);
    for (std::size_t i = 0; i < total; ++i) {
        outcomes[i].ordinal = i;
        outcomes[i].source = samples.paths[i];
        outcomes[i].output = writer.outputPathFor(i);
        outcomes[i].status = ItemStatus::Skipped;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> done{0};
    const std::size_t step = std::max<std::size_t>(1, total / 10);

    std::mutex error_mutex;
    std::exception_ptr first_error;
    std::atomic<bool> failed{false};

    auto worker = [&]() {
        while (!failed.load() && !stopRequested()) {
            const std::size_t idx = next.fetch_add(1);
            if (idx >= total) break;
            try {
                outcomes[idx] = processItem(idx, samples.paths[idx], normalizer, writer);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                failed.store(true);
                break;
            }
            const std::size_t finished = done.fetch_add(1) + 1;
            if (finished % step == 0 || finished == total) {
                logger.info("Processing images: " + std::to_string(finished) + "/" + std::to_string(total));
            }
        }
    };

    const std::size_t thread_count =
        std::min<std::size_t>(static_cast<std::size_t>(std::max(1, cfg.workers)), std::max<std::size_t>(1, total));
    if (thread_count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return outcomes;
}

// Stages run strictly in sequence; each one only consumes the previous
// stage's output. The manifest is rebuilt from the directory contents, so
// it is generated even after an interrupt and always matches what exists.
PipelineSummary Pipeline::run() {
    validateConfig(cfg);

    PipelineSummary summary;
    Profiler profiler(logger);

    // Collect
    profiler.start();
    PathCollector collector(cfg.extensions);
    collector.exclude(cfg.output_dir);
    Corpus corpus = collector.collect(cfg.source_dir);
    summary.collected = corpus.size();
    logger.info("Found " + std::to_string(corpus.size()) + " images in " + cfg.source_dir.string());
    profiler.end("collect");

    // Sample
    profiler.start();
    Sampler sampler(cfg.num_images, cfg.seed);
    SampleSet samples = sampler.sample(corpus);
    summary.sampled = samples.paths.size();
    summary.used_all = samples.used_all;
    if (samples.used_all) {
        logger.info("Requested " + std::to_string(cfg.num_images) + " images, but only " +
                    std::to_string(corpus.size()) + " available. Using all.");
    } else {
        logger.info("Sampled " + std::to_string(samples.paths.size()) + " images from " +
                    std::to_string(corpus.size()) + " total (seed " + std::to_string(cfg.seed) + ")");
    }
    profiler.end("sample");

    if (cfg.dry_run) {
        summary.dry_run = true;
        for (std::size_t i = 0; i < samples.paths.size(); ++i) {
            logger.info(Utils::ordinalFileName(i) + " <- " + samples.paths[i].string());
        }
        logger.info("Dry run: nothing written to " + cfg.output_dir.string());
        return summary;
    }

    // Normalize + write
    profiler.start();
    ImageNormalizer normalizer(cfg.width, cfg.height);
    CorpusWriter writer(cfg.output_dir, cfg.quality, logger);
    summary.stale_removed = writer.prepare();
    if (summary.stale_removed > 0) {
        logger.info("Removed " + std::to_string(summary.stale_removed) + " calibration images from a previous run");
    }

    logger.info("Processing " + std::to_string(samples.paths.size()) + " images at " +
                std::to_string(cfg.width) + "x" + std::to_string(cfg.height) + " with " +
                std::to_string(cfg.workers) + " worker(s)...");
    summary.outcomes = processAll(samples, normalizer, writer);
    for (const auto& outcome : summary.outcomes) {
        switch (outcome.status) {
            case ItemStatus::Written: ++summary.written; break;
            case ItemStatus::DecodeFailure: ++summary.decode_failures; break;
            case ItemStatus::EncodeFailure: ++summary.encode_failures; break;
            case ItemStatus::WriteFailure: ++summary.write_failures; break;
            case ItemStatus::Skipped: ++summary.skipped; break;
        }
    }
    summary.interrupted = summary.skipped > 0 && stopRequested();
    logger.info("Successfully processed " + std::to_string(summary.written) + "/" +
                std::to_string(samples.paths.size()) + " images");
    if (summary.interrupted) {
        logger.warning("Interrupted: " + std::to_string(summary.skipped) + " images were not processed");
    }
    profiler.end("normalize+write");

    if (summary.written == 0) {
        // The caller never sees this summary, so the tally is reported here.
        logSummary(logger, summary);
        throw EmptyResultError("No images were successfully processed");
    }

    // Manifest
    profiler.start();
    ManifestGenerator generator(cfg.output_dir);
    Manifest manifest = generator.generate();
    summary.manifest_entries = manifest.entries.size();
    summary.manifest_path = manifest.file;
    logger.info("Generated image list with " + std::to_string(manifest.entries.size()) +
                " entries: " + manifest.file.string());
    if (manifest.entries.size() != summary.written) {
        logger.warning("Image list has " + std::to_string(manifest.entries.size()) +
                       " entries but " + std::to_string(summary.written) +
                       " images were written in this run; the list follows the directory");
    }
    profiler.end("manifest");

    return summary;
}

int exitCodeFor(const PipelineSummary& summary) {
    if (summary.dry_run) {
        return summary.sampled > 0 ? 0 : 1;
    }
    if (summary.interrupted) return 1;
    if (summary.written == 0 || summary.manifest_entries == 0) return 1;
    return 0;
}

void logSummary(Logger& logger, const PipelineSummary& summary) {
    std::ostringstream oss;
    oss << "Summary: collected " << summary.collected
        << ", sampled " << summary.sampled
        << ", written " << summary.written
        << ", failed " << summary.failures()
        << " (decode " << summary.decode_failures
        << ", encode " << summary.encode_failures
        << ", write " << summary.write_failures << ")";
    if (summary.skipped > 0) {
        oss << ", skipped " << summary.skipped;
    }
    logger.info(oss.str());

    for (const auto& outcome : summary.outcomes) {
        if (outcome.ok() || outcome.status == ItemStatus::Skipped) continue;
        logger.info("  " + Utils::ordinalFileName(outcome.ordinal) + ": " + toString(outcome.status) +
                    " - " + outcome.source.string());
    }
}

} // namespace calib
