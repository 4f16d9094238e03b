#include "calibset/CorpusWriter.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "calibset/Errors.hpp"
#include "calibset/utils.hpp"

namespace fs = std::filesystem;

namespace calib {

namespace {

    void discardPart(const fs::path& part) {
        std::error_code ec;
        fs::remove(part, ec);
    }

}

CorpusWriter::CorpusWriter(const fs::path& outputDir, int quality, Logger& logger)
    : output_dir(fs::absolute(outputDir).lexically_normal()), jpeg_quality(quality), logger(logger) {
    if (quality < 1 || quality > 100) {
        throw ValidationError("Quality must be in 1..100, got " + std::to_string(quality));
    }
}

fs::path CorpusWriter::outputPathFor(std::size_t ordinal) const {
    return output_dir / Utils::ordinalFileName(ordinal);
}

// Stale outputs are collected first and removed afterwards; removing while
// a directory_iterator is live leaves the iteration unspecified.
std::size_t CorpusWriter::prepare() const {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw IOError("Failed to create output directory " + output_dir.string() + ": " + ec.message());
    }
    if (!fs::is_directory(output_dir, ec)) {
        throw IOError("Output path is not a directory: " + output_dir.string());
    }

    std::vector<fs::path> stale;
    fs::directory_iterator it(output_dir, ec);
    if (ec) {
        throw IOError("Cannot list output directory " + output_dir.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end;) {
        const std::string name = it->path().filename().string();
        if (Utils::isCanonicalName(name) || Utils::isPartName(name)) {
            stale.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            throw IOError("Cannot list output directory " + output_dir.string() + ": " + ec.message());
        }
    }

    std::size_t removed = 0;
    for (const auto& path : stale) {
        std::error_code rm_ec;
        if (fs::remove(path, rm_ec)) {
            ++removed;
            logger.debug("Removed old file " + path.string());
        } else {
            logger.warning("Failed to remove old file " + path.string() + ": " +
                           (rm_ec ? rm_ec.message() : std::string("not removed")));
        }
    }
    return removed;
}

ItemOutcome CorpusWriter::write(std::size_t ordinal, const cv::Mat& image) const {
    ItemOutcome outcome;
    outcome.ordinal = ordinal;
    outcome.output = outputPathFor(ordinal);

    std::vector<uchar> buffer;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
    try {
        if (image.empty() || !cv::imencode(Utils::kOutputExtension, image, buffer, params)) {
            outcome.status = ItemStatus::EncodeFailure;
            outcome.message = "encoder rejected the image";
            return outcome;
        }
    } catch (const cv::Exception& e) {
        outcome.status = ItemStatus::EncodeFailure;
        outcome.message = std::string("encoder error: ") + e.what();
        return outcome;
    }

    const fs::path part = output_dir / Utils::partFileName(outcome.output.filename().string());
    {
        std::ofstream ofs(part, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            outcome.status = ItemStatus::WriteFailure;
            outcome.message = "cannot open " + part.string() + " for writing";
            return outcome;
        }
        ofs.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            discardPart(part);
            outcome.status = ItemStatus::WriteFailure;
            outcome.message = "short write to " + part.string();
            return outcome;
        }
    }

    std::error_code ec;
    fs::rename(part, outcome.output, ec);
    if (ec) {
        discardPart(part);
        outcome.status = ItemStatus::WriteFailure;
        outcome.message = "cannot move " + part.string() + " into place: " + ec.message();
        return outcome;
    }

    outcome.status = ItemStatus::Written;
    return outcome;
}

} // namespace calib
