#ifndef CALIBSET_CONFIG_HPP
#define CALIBSET_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace calib {

// Run parameters. Defaults match the 1x3x392x644 input the exported
// depth model declares; width and height must follow that model.
struct Config {
    std::filesystem::path source_dir;
    std::filesystem::path output_dir = "./calibration_images";
    int num_images = 300;
    int width = 644;
    int height = 392;
    std::int64_t seed = 42;
    int quality = 95;
    bool verbose = false;
    int workers = 1;
    std::vector<std::string> extensions = {".jpg", ".jpeg", ".png"};
    bool dry_run = false;
};

// Throws ValidationError naming the first offending field.
void validateConfig(const Config& config);

} // namespace calib

#endif // CALIBSET_CONFIG_HPP
