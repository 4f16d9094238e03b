#ifndef CALIBSET_PROFILER_HPP
#define CALIBSET_PROFILER_HPP

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#include "calibset/Logger.hpp"

namespace calib {

// Stage timer. Results go to the logger at debug level so a normal run
// stays quiet and --verbose shows where the time went.
class Profiler {
public:
    explicit Profiler(Logger& logger) : logger(logger) {}

    // Start the timer
    void start() {
        start_time = std::chrono::steady_clock::now();
        start_memory = getMemoryUsageKB();
    }

    // End the timer, report and return the elapsed milliseconds
    double end(const std::string& processName = "") {
        auto end_time = std::chrono::steady_clock::now();
        auto end_memory = getMemoryUsageKB();

        double duration_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        long memory_diff = end_memory - start_memory;

        std::ostringstream oss;
        oss << "Stage";
        if (!processName.empty()) {
            oss << " '" << processName << "'";
        }
        oss << ": elapsed " << std::fixed << std::setprecision(1) << duration_ms
            << " ms, memory change " << memory_diff << " KB";
        logger.debug(oss.str());
        return duration_ms;
    }

private:
    Logger& logger;
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();
    long start_memory = 0;

    // Get current memory usage in KB (Linux). 0 where /proc is unavailable.
    static long getMemoryUsageKB() {
        std::ifstream stat_file("/proc/self/status");
        std::string line;
        while (std::getline(stat_file, line)) {
            if (line.compare(0, 6, "VmRSS:") == 0) {
                std::istringstream value(line.substr(6));
                long kb = 0;
                value >> kb;
                return kb;
            }
        }
        return 0;
    }
};

} // namespace calib

#endif // CALIBSET_PROFILER_HPP
