#include "calibset/ImageNormalizer.hpp"

#include <string>
#include <system_error>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "calibset/Errors.hpp"

namespace fs = std::filesystem;

namespace calib {

ImageNormalizer::ImageNormalizer(int width, int height)
    : target_width(width), target_height(height) {
    if (width <= 0 || height <= 0) {
        throw ValidationError("Target size must be positive, got " +
                              std::to_string(width) + "x" + std::to_string(height));
    }
}

NormalizeResult ImageNormalizer::normalize(const fs::path& path) const {
    NormalizeResult result;

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        result.error = "cannot stat file: " + ec.message();
        return result;
    }
    if (size == 0) {
        result.error = "zero-byte file";
        return result;
    }

    // IMREAD_COLOR always yields 3 channels in OpenCV's BGR order,
    // grayscale and alpha inputs included.
    cv::Mat decoded;
    try {
        decoded = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        result.error = std::string("decoder error: ") + e.what();
        return result;
    }
    if (decoded.empty()) {
        result.error = "unsupported or corrupt image data";
        return result;
    }

    try {
        result.normalized = resizeIfNeeded(decoded);
    } catch (const cv::Exception& e) {
        result.error = std::string("resize failed: ") + e.what();
        return result;
    }
    result.ok = true;
    return result;
}

NormalizedImage ImageNormalizer::resizeIfNeeded(const cv::Mat& decoded) const {
    NormalizedImage out;
    out.source_width = decoded.cols;
    out.source_height = decoded.rows;
    out.width = target_width;
    out.height = target_height;

    if (decoded.cols == target_width && decoded.rows == target_height) {
        out.img = decoded;
        out.resized = false;
        return out;
    }

    cv::resize(decoded, out.img, targetSize(), 0, 0, cv::INTER_LINEAR);
    out.resized = true;
    return out;
}

} // namespace calib
