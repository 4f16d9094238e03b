#ifndef CALIBSET_PATH_COLLECTOR_HPP
#define CALIBSET_PATH_COLLECTOR_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace calib {

using ImagePath = std::filesystem::path;
using Corpus = std::vector<ImagePath>;

// Recursively finds candidate images under a root directory.
class PathCollector {
public:
    explicit PathCollector(const std::vector<std::string>& extensions = defaultExtensions());

    static std::vector<std::string> defaultExtensions();

    // Absolute, lexically normal, de-duplicated paths sorted by path string.
    // Throws NotFoundError, NotADirectoryError, EmptyCorpusError, IOError.
    Corpus collect(const std::filesystem::path& root) const;

    // Leave this directory out of collect(): it holds our own outputs when
    // the output directory sits inside the source tree. If it is the source
    // root itself, only calib_NNNNNN files directly in it are left out.
    void exclude(const std::filesystem::path& dir);

    // Case-insensitive extension match.
    bool matches(const std::filesystem::path& file) const;

    const std::vector<std::string>& extensions() const { return suffixes; }

private:
    std::vector<std::string> suffixes;   // lower case, with leading dot
    std::filesystem::path excluded;      // absolute, lexically normal; empty for none
};

} // namespace calib

#endif // CALIBSET_PATH_COLLECTOR_HPP
