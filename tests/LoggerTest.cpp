#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "calibset/Logger.hpp"
#include "calibset/Profiler.hpp"

using calib::Logger;

int main() {
    std::cout << "[Test] Starting Logger Test..." << std::endl;

    std::ostringstream out;
    Logger logger(Logger::Level::Info, out);

    logger.debug("hidden detail");
    logger.info("visible info");
    logger.warning("visible warning");
    logger.error("visible error");

    const std::string text = out.str();
    assert(text.find("hidden detail") == std::string::npos);
    assert(text.find(" - calibset - INFO - visible info") != std::string::npos);
    assert(text.find(" - calibset - WARNING - visible warning") != std::string::npos);
    assert(text.find(" - calibset - ERROR - visible error") != std::string::npos);

    // "YYYY-MM-DD HH:MM:SS - "
    assert(text.size() > 22);
    assert(text[4] == '-' && text[7] == '-' && text[10] == ' ' && text[13] == ':' && text[16] == ':');

    out.str("");
    logger.setLevel(Logger::Level::Debug);
    calib::Profiler profiler(logger);
    profiler.start();
    const double ms = profiler.end("collect");
    assert(ms >= 0.0);
    assert(out.str().find("DEBUG - Stage 'collect': elapsed") != std::string::npos);

    std::cout << "[PASS] Logger Test." << std::endl;
    return 0;
}
