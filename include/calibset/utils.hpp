#ifndef CALIBSET_UTILS_HPP
#define CALIBSET_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace calib {
namespace Utils {

    constexpr const char* kOutputPrefix = "calib_";
    constexpr const char* kOutputExtension = ".jpg";
    constexpr const char* kManifestName = "calibration_list.txt";
    constexpr const char* kPartSuffix = ".part";
    constexpr std::size_t kOrdinalWidth = 6;
    // Ordinals 0..999999 fit the fixed width; a larger sample would produce
    // names the manifest and stale cleanup do not recognize.
    constexpr int kMaxImages = 1000000;

    inline std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    inline bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // "JPG" -> ".jpg", ".Png" -> ".png"
    inline std::string normalizeExtension(const std::string& ext) {
        std::string out = toLower(ext);
        if (!out.empty() && out.front() != '.') {
            out.insert(out.begin(), '.');
        }
        return out;
    }

    inline std::vector<std::string> splitCsv(const std::string& s) {
        std::vector<std::string> out;
        std::string cur;
        for (char c : s) {
            if (c == ',') {
                if (!cur.empty()) out.push_back(cur);
                cur.clear();
            } else if (!std::isspace(static_cast<unsigned char>(c))) {
                cur.push_back(c);
            }
        }
        if (!cur.empty()) out.push_back(cur);
        return out;
    }

    // 42 -> "calib_000042.jpg"
    inline std::string ordinalFileName(std::size_t ordinal,
                                       const std::string& ext = kOutputExtension) {
        std::ostringstream oss;
        oss << kOutputPrefix << std::setw(static_cast<int>(kOrdinalWidth))
            << std::setfill('0') << ordinal << ext;
        return oss.str();
    }

    // Staging name a file carries until it is complete: ".calib_000042.jpg.part"
    inline std::string partFileName(const std::string& finalName) {
        return "." + finalName + kPartSuffix;
    }

    // Matches exactly calib_<6 digits><ext>. Wider ordinals are not ours.
    inline bool isCanonicalName(const std::string& name,
                                const std::string& ext = kOutputExtension) {
        const std::string prefix = kOutputPrefix;
        if (name.size() != prefix.size() + kOrdinalWidth + ext.size()) return false;
        if (name.compare(0, prefix.size(), prefix) != 0) return false;
        for (std::size_t i = 0; i < kOrdinalWidth; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(name[prefix.size() + i]))) return false;
        }
        return endsWith(name, ext);
    }

    inline bool isPartName(const std::string& name,
                           const std::string& ext = kOutputExtension) {
        const std::string suffix = kPartSuffix;
        if (name.size() <= 1 + suffix.size() || name.front() != '.') return false;
        if (!endsWith(name, suffix)) return false;
        return isCanonicalName(name.substr(1, name.size() - 1 - suffix.size()), ext);
    }

} // namespace Utils
} // namespace calib

#endif // CALIBSET_UTILS_HPP
