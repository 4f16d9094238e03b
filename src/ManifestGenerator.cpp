#include "calibset/ManifestGenerator.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>

#include "calibset/Errors.hpp"
#include "calibset/utils.hpp"

namespace fs = std::filesystem;

namespace calib {

ManifestGenerator::ManifestGenerator(const fs::path& outputDir)
    : output_dir(fs::absolute(outputDir).lexically_normal()) {}

fs::path ManifestGenerator::manifestPath() const {
    return output_dir / Utils::kManifestName;
}

std::vector<fs::path> ManifestGenerator::scan() const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(output_dir, ec);
    if (ec) {
        throw IOError("Cannot list output directory " + output_dir.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end;) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && Utils::isCanonicalName(it->path().filename().string())) {
            files.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            throw IOError("Cannot list output directory " + output_dir.string() + ": " + ec.message());
        }
    }

    // Fixed-width ordinals: file name order is ordinal order.
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

Manifest ManifestGenerator::generate() const {
    Manifest manifest;
    manifest.file = manifestPath();
    manifest.entries = scan();
    if (manifest.entries.empty()) {
        throw EmptyManifestError("No calibration images found to list in " + output_dir.string());
    }

    std::string content;
    for (const auto& entry : manifest.entries) {
        content += entry.string();
        content += '\n';
    }

    const fs::path part = output_dir / Utils::partFileName(Utils::kManifestName);
    {
        std::ofstream ofs(part, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw IOError("Failed to open " + part.string() + " for writing");
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code rm_ec;
            fs::remove(part, rm_ec);
            throw IOError("Failed to write image list file " + part.string());
        }
    }

    std::error_code ec;
    fs::rename(part, manifest.file, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(part, rm_ec);
        throw IOError("Failed to write image list file " + manifest.file.string() + ": " + ec.message());
    }
    return manifest;
}

} // namespace calib
