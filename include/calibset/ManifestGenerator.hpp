#ifndef CALIBSET_MANIFEST_GENERATOR_HPP
#define CALIBSET_MANIFEST_GENERATOR_HPP

#include <filesystem>
#include <vector>

namespace calib {

struct Manifest {
    std::filesystem::path file;
    std::vector<std::filesystem::path> entries;
};

// Builds calibration_list.txt from what is actually in the output
// directory, not from what the writer believes it wrote.
class ManifestGenerator {
public:
    explicit ManifestGenerator(const std::filesystem::path& outputDir);

    // Absolute paths of calib_NNNNNN.jpg files, sorted by file name.
    // Throws IOError when the directory cannot be listed.
    std::vector<std::filesystem::path> scan() const;

    // Throws EmptyManifestError when scan() finds nothing, IOError on write failure.
    Manifest generate() const;

    std::filesystem::path manifestPath() const;

private:
    std::filesystem::path output_dir;
};

} // namespace calib

#endif // CALIBSET_MANIFEST_GENERATOR_HPP
