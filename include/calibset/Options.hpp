#ifndef CALIBSET_OPTIONS_HPP
#define CALIBSET_OPTIONS_HPP

#include <ostream>

#include "calibset/Config.hpp"

namespace calib {

struct ParsedOptions {
    Config config;
    bool show_help = false;
};

// Parses the command line into a validated Config.
// Throws ValidationError on unknown flags, missing or malformed values.
ParsedOptions parseOptions(int argc, char** argv);

void printUsage(std::ostream& out, const char* prog);

} // namespace calib

#endif // CALIBSET_OPTIONS_HPP
