#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include "calibset/Errors.hpp"
#include "calibset/Logger.hpp"
#include "calibset/Options.hpp"
#include "calibset/Pipeline.hpp"
#include "calibset/StopToken.hpp"

namespace {

// The one piece of state a signal handler can reach. Owned by main().
calib::StopToken* active_stop = nullptr;

void handleStopSignal(int) {
    if (active_stop != nullptr) {
        active_stop->requestStop();
    }
}

}

int main(int argc, char** argv) {
    calib::ParsedOptions parsed;
    try {
        parsed = calib::parseOptions(argc, argv);
    } catch (const calib::ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        calib::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (parsed.show_help) {
        calib::printUsage(std::cout, argv[0]);
        return 0;
    }

    calib::Logger logger(parsed.config.verbose ? calib::Logger::Level::Debug : calib::Logger::Level::Info);

    calib::StopToken stop;
    active_stop = &stop;
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    try {
        calib::Pipeline pipeline(parsed.config, logger, &stop);
        calib::PipelineSummary summary = pipeline.run();
        calib::logSummary(logger, summary);

        const int code = calib::exitCodeFor(summary);
        if (code == 0) {
            logger.info("Calibration dataset generation completed successfully!");
        } else if (summary.interrupted) {
            logger.error("Run interrupted; the image list covers only the images written so far");
        }
        return code;
    } catch (const calib::ValidationError& e) {
        logger.error(std::string("Validation error: ") + e.what());
    } catch (const calib::EmptyResultError& e) {
        logger.error(std::string("Nothing to calibrate with: ") + e.what());
    } catch (const calib::IOError& e) {
        logger.error(std::string("I/O error: ") + e.what());
    } catch (const std::exception& e) {
        logger.error(std::string("Unexpected error: ") + e.what());
    }
    return 1;
}
