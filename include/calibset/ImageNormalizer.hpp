#ifndef CALIBSET_IMAGE_NORMALIZER_HPP
#define CALIBSET_IMAGE_NORMALIZER_HPP

#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

namespace calib {

class NormalizedImage {
public:
    cv::Mat img;              // 3 channels, channel order as decoded (BGR)
    int width = 0;            // equal to the target after normalization
    int height = 0;
    int source_width = 0;
    int source_height = 0;
    bool resized = false;     // false: the decoded raster is passed through untouched
};

class NormalizeResult {
public:
    bool ok = false;
    NormalizedImage normalized;
    std::string error;        // decode failure reason when !ok
};

// Decodes one image and brings it to the target resolution.
// A bad file is a per-item failure, never an exception.
class ImageNormalizer {
public:
    // Throws ValidationError when width or height is not positive.
    ImageNormalizer(int width, int height);

    NormalizeResult normalize(const std::filesystem::path& path) const;

    // Direct, non-uniform bilinear resize; no-op when the size already matches.
    NormalizedImage resizeIfNeeded(const cv::Mat& decoded) const;

    cv::Size targetSize() const { return cv::Size(target_width, target_height); }

private:
    int target_width;
    int target_height;
};

} // namespace calib

#endif // CALIBSET_IMAGE_NORMALIZER_HPP
