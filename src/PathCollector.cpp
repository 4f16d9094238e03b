#include "calibset/PathCollector.hpp"

#include <algorithm>
#include <system_error>

#include "calibset/Errors.hpp"
#include "calibset/utils.hpp"

namespace fs = std::filesystem;

namespace calib {

PathCollector::PathCollector(const std::vector<std::string>& extensions) {
    for (const auto& ext : extensions) {
        std::string normalized = Utils::normalizeExtension(ext);
        if (normalized.empty()) continue;
        if (std::find(suffixes.begin(), suffixes.end(), normalized) == suffixes.end()) {
            suffixes.push_back(normalized);
        }
    }
}

std::vector<std::string> PathCollector::defaultExtensions() {
    return {".jpg", ".jpeg", ".png"};
}

void PathCollector::exclude(const fs::path& dir) {
    fs::path normal = fs::absolute(dir).lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    excluded = normal;
}

bool PathCollector::matches(const fs::path& file) const {
    const std::string ext = Utils::toLower(file.extension().string());
    return std::find(suffixes.begin(), suffixes.end(), ext) != suffixes.end();
}

// Walk the whole tree once and compare lower-cased extensions, so a.JPG and
// a.jpg style variants are matched by the same test and each file is seen once.
// Identity is the absolute, lexically normal path; sort + unique removes any
// duplicate that still gets through (e.g. a root given with "..").
Corpus PathCollector::collect(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw NotFoundError("Source directory not found: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw NotADirectoryError("Source path is not a directory: " + root.string());
    }

    fs::path base = fs::absolute(root, ec);
    if (ec) {
        throw IOError("Cannot resolve source directory " + root.string() + ": " + ec.message());
    }
    base = base.lexically_normal();

    if (base.filename().empty()) {
        base = base.parent_path();
    }

    Corpus corpus;
    try {
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied);
        for (fs::recursive_directory_iterator end; it != end; ++it) {
            const fs::path path = it->path().lexically_normal();
            std::error_code type_ec;
            if (!excluded.empty() && it->is_directory(type_ec) && path == excluded) {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(type_ec)) continue;
            if (!matches(path)) continue;
            if (!excluded.empty() && path.parent_path() == excluded &&
                Utils::isCanonicalName(path.filename().string())) {
                continue;
            }
            corpus.push_back(path);
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Cannot read source directory " + base.string() + ": " + e.what());
    }

    std::sort(corpus.begin(), corpus.end(),
              [](const ImagePath& a, const ImagePath& b) { return a.string() < b.string(); });
    corpus.erase(std::unique(corpus.begin(), corpus.end(),
                             [](const ImagePath& a, const ImagePath& b) { return a.string() == b.string(); }),
                 corpus.end());

    if (corpus.empty()) {
        std::string list;
        for (const auto& ext : suffixes) {
            if (!list.empty()) list += ", ";
            list += ext;
        }
        throw EmptyCorpusError("No images found in " + base.string() + " with extensions " + list);
    }
    return corpus;
}

} // namespace calib
