#include "calibset/Options.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "calibset/Errors.hpp"
#include "calibset/utils.hpp"

namespace calib {

namespace {

    long long parseInteger(const std::string& flag, const std::string& value) {
        std::size_t consumed = 0;
        long long parsed = 0;
        try {
            parsed = std::stoll(value, &consumed);
        } catch (const std::invalid_argument&) {
            throw ValidationError("Invalid integer for " + flag + ": '" + value + "'");
        } catch (const std::out_of_range&) {
            throw ValidationError("Value out of range for " + flag + ": '" + value + "'");
        }
        if (consumed != value.size()) {
            throw ValidationError("Invalid integer for " + flag + ": '" + value + "'");
        }
        return parsed;
    }

    int parseInt(const std::string& flag, const std::string& value) {
        const long long parsed = parseInteger(flag, value);
        if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            throw ValidationError("Value out of range for " + flag + ": '" + value + "'");
        }
        return static_cast<int>(parsed);
    }

}

void validateConfig(const Config& config) {
    if (config.source_dir.empty()) {
        throw ValidationError("--source-dir is required");
    }
    if (config.output_dir.empty()) {
        throw ValidationError("--output-dir must not be empty");
    }
    if (config.num_images <= 0) {
        throw ValidationError("--num-images must be positive, got " + std::to_string(config.num_images));
    }
    if (config.num_images > Utils::kMaxImages) {
        throw ValidationError("--num-images must be at most " + std::to_string(Utils::kMaxImages) +
                              ", got " + std::to_string(config.num_images));
    }
    if (config.width <= 0 || config.height <= 0) {
        throw ValidationError("--width and --height must be positive, got " +
                              std::to_string(config.width) + "x" + std::to_string(config.height));
    }
    if (config.quality < 1 || config.quality > 100) {
        throw ValidationError("--quality must be in [1-100], got " + std::to_string(config.quality));
    }
    if (config.workers <= 0) {
        throw ValidationError("--workers must be positive, got " + std::to_string(config.workers));
    }
    if (config.extensions.empty()) {
        throw ValidationError("--extensions must name at least one extension");
    }
}

void printUsage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog << " --source-dir <dir> [options]\n\n"
        << "Generate a calibration image dataset for INT8 quantization.\n\n"
        << "Options:\n"
        << "  --source-dir <dir>     Source directory containing input images (required)\n"
        << "  --output-dir <dir>     Output directory for calibration images (default ./calibration_images)\n"
        << "  --num-images N         Number of images to sample (default 300)\n"
        << "  --width W              Target image width (default 644)\n"
        << "  --height H             Target image height (default 392)\n"
        << "  --seed S               Random seed for reproducible sampling (default 42)\n"
        << "  --quality [1-100]      JPEG compression quality (default 95)\n"
        << "  --workers N            Worker threads for decode/resize/write (default 1)\n"
        << "  --extensions LIST      Comma-separated extensions (default .jpg,.jpeg,.png)\n"
        << "  --dry-run              Collect and sample only; write nothing\n"
        << "  --verbose              Enable verbose logging\n"
        << "  --help                 Show this help\n";
}

ParsedOptions parseOptions(int argc, char** argv) {
    ParsedOptions parsed;
    Config& cfg = parsed.config;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need_next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ValidationError("Missing value for " + a);
            }
            return argv[++i];
        };

        if (a == "--help" || a == "-h") {
            parsed.show_help = true;
            return parsed;
        } else if (a == "--source-dir") {
            cfg.source_dir = need_next();
        } else if (a == "--output-dir") {
            cfg.output_dir = need_next();
        } else if (a == "--num-images") {
            cfg.num_images = parseInt(a, need_next());
        } else if (a == "--width") {
            cfg.width = parseInt(a, need_next());
        } else if (a == "--height") {
            cfg.height = parseInt(a, need_next());
        } else if (a == "--seed") {
            cfg.seed = parseInteger(a, need_next());
        } else if (a == "--quality") {
            cfg.quality = parseInt(a, need_next());
        } else if (a == "--workers") {
            cfg.workers = parseInt(a, need_next());
        } else if (a == "--extensions") {
            cfg.extensions.clear();
            for (const auto& ext : Utils::splitCsv(need_next())) {
                cfg.extensions.push_back(Utils::normalizeExtension(ext));
            }
        } else if (a == "--dry-run") {
            cfg.dry_run = true;
        } else if (a == "--verbose") {
            cfg.verbose = true;
        } else {
            throw ValidationError("Unknown argument: " + a);
        }
    }

    validateConfig(cfg);
    return parsed;
}

} // namespace calib
