#pragma once

#include "core/config_loader.h"

#include <string>

namespace ad_silencer::core {

struct AppOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    bool configPathGiven = false;  // missing file is an error only when explicit
    std::string playerName;        // empty = keep config value
    std::string fillerDir;         // positional; empty = keep config value
    bool fillerDirGiven = false;
    bool debug = false;
};

// Parses argv into options. Returns false on -h/--help (showHelp=true) or on
// an invalid argument (error filled, help printed).
bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error);

// Command-line values take precedence over file and environment values.
void applyOptions(const AppOptions& options, AppConfig& config);

void printHelp(const char* exeName);

}  // namespace ad_silencer::core
