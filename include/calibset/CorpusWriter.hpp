#ifndef CALIBSET_CORPUS_WRITER_HPP
#define CALIBSET_CORPUS_WRITER_HPP

#include <cstddef>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

#include "calibset/Logger.hpp"
#include "calibset/Outcome.hpp"

namespace calib {

// Writes normalized images as calib_NNNNNN.jpg into the output directory.
class CorpusWriter {
public:
    // Throws ValidationError when quality is outside 1..100.
    CorpusWriter(const std::filesystem::path& outputDir, int quality, Logger& logger);

    // Creates the directory and deletes calib_NNNNNN.jpg files and staging
    // leftovers from earlier runs. Other files are left alone.
    // Returns the number of files removed. Throws IOError if the directory
    // cannot be created or listed; a file that cannot be removed is only logged.
    std::size_t prepare() const;

    // Encodes and writes one image under its ordinal name. The bytes go to a
    // hidden .part file first and are renamed into place once complete.
    // Returns Written, EncodeFailure or WriteFailure; never throws for a bad item.
    ItemOutcome write(std::size_t ordinal, const cv::Mat& image) const;

    std::filesystem::path outputPathFor(std::size_t ordinal) const;
    const std::filesystem::path& directory() const { return output_dir; }
    int quality() const { return jpeg_quality; }

private:
    std::filesystem::path output_dir;    // absolute
    int jpeg_quality;
    Logger& logger;
};

} // namespace calib

#endif // CALIBSET_CORPUS_WRITER_HPP
