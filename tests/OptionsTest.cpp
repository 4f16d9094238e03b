#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "calibset/Errors.hpp"
#include "calibset/Options.hpp"

namespace {

    calib::ParsedOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "calibset");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(&a[0]);
        return calib::parseOptions(static_cast<int>(argv.size()), argv.data());
    }

    bool rejects(const std::vector<std::string>& args) {
        try {
            parse(args);
        } catch (const calib::ValidationError&) {
            return true;
        }
        return false;
    }

}

int main() {
    std::cout << "[Test] Starting Options Test..." << std::endl;

    // Defaults
    {
        auto parsed = parse({"--source-dir", "images"});
        const auto& cfg = parsed.config;
        assert(!parsed.show_help);
        assert(cfg.source_dir == "images");
        assert(cfg.output_dir == "./calibration_images");
        assert(cfg.num_images == 300);
        assert(cfg.width == 644);
        assert(cfg.height == 392);
        assert(cfg.seed == 42);
        assert(cfg.quality == 95);
        assert(cfg.workers == 1);
        assert(!cfg.verbose);
        assert(!cfg.dry_run);
        assert((cfg.extensions == std::vector<std::string>{".jpg", ".jpeg", ".png"}));
    }

    // Every flag
    {
        auto parsed = parse({"--source-dir", "/data/src", "--output-dir", "/tmp/out",
                             "--num-images", "50", "--width", "320", "--height", "240",
                             "--seed", "-7", "--quality", "80", "--workers", "4",
                             "--extensions", "PNG, bmp", "--dry-run", "--verbose"});
        const auto& cfg = parsed.config;
        assert(cfg.source_dir == "/data/src");
        assert(cfg.output_dir == "/tmp/out");
        assert(cfg.num_images == 50);
        assert(cfg.width == 320);
        assert(cfg.height == 240);
        assert(cfg.seed == -7);
        assert(cfg.quality == 80);
        assert(cfg.workers == 4);
        assert(cfg.dry_run);
        assert(cfg.verbose);
        assert((cfg.extensions == std::vector<std::string>{".png", ".bmp"}));
    }

    assert(parse({"--help"}).show_help);

    assert(rejects({}));
    assert(rejects({"--source-dir"}));
    assert(rejects({"--source-dir", "x", "--num-images", "0"}));
    assert(rejects({"--source-dir", "x", "--num-images", "-5"}));
    assert(rejects({"--source-dir", "x", "--num-images", "ten"}));
    assert(rejects({"--source-dir", "x", "--num-images", "10x"}));
    assert(rejects({"--source-dir", "x", "--quality", "0"}));
    assert(rejects({"--source-dir", "x", "--quality", "101"}));
    assert(rejects({"--source-dir", "x", "--width", "0"}));
    assert(rejects({"--source-dir", "x", "--height", "-1"}));
    assert(rejects({"--source-dir", "x", "--workers", "0"}));
    assert(rejects({"--source-dir", "x", "--extensions", ","}));
    assert(rejects({"--source-dir", "x", "--bogus"}));
    assert(rejects({"--source-dir", "x", "--width", "99999999999"}));

    // Ordinals must fit the six-digit file names.
    assert(!rejects({"--source-dir", "x", "--num-images", "1000000"}));
    assert(rejects({"--source-dir", "x", "--num-images", "1000001"}));

    assert(!rejects({"--source-dir", "x", "--quality", "1"}));
    assert(!rejects({"--source-dir", "x", "--quality", "100"}));

    std::cout << "[PASS] Options Test." << std::endl;
    return 0;
}
