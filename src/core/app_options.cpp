#include "core/app_options.h"

#include <iostream>

namespace ad_silencer::core {

void printHelp(const char* exeName) {
    std::cout << "ad_silencer - mutes advertisements of an MPRIS media player\n";
    std::cout << "Usage: " << exeName << " [options] [FILLER_DIR]\n\n";
    std::cout << "  FILLER_DIR              play a random clip from this directory during ads\n";
    std::cout << "                          (omit to only mute the player)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>     JSON config file (default: " << DEFAULT_CONFIG_FILE
              << ")\n";
    std::cout << "  -p, --player <name>     MPRIS player name (default: spotify)\n";
    std::cout << "  -d, --debug             verbose logging (same as " << ENV_DEBUG << "=1)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    bool positionalSeen = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            showHelp = true;
            return false;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                printHelp(argv[0]);
                return false;
            }
            options.configPath = argv[++i];
            options.configPathGiven = true;
            continue;
        }
        if (arg == "-p" || arg == "--player") {
            if (i + 1 >= argc || argv[i + 1][0] == '\0') {
                error = "Missing value for " + arg;
                printHelp(argv[0]);
                return false;
            }
            options.playerName = argv[++i];
            continue;
        }
        if (arg == "-d" || arg == "--debug") {
            options.debug = true;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            printHelp(argv[0]);
            return false;
        }
        if (positionalSeen) {
            error = "Unexpected argument: " + arg;
            printHelp(argv[0]);
            return false;
        }
        options.fillerDir = arg;
        options.fillerDirGiven = true;
        positionalSeen = true;
    }
    return true;
}

void applyOptions(const AppOptions& options, AppConfig& config) {
    if (!options.playerName.empty()) {
        config.playerName = options.playerName;
    }
    if (options.fillerDirGiven) {
        config.fillerDir = options.fillerDir;
    }
    if (options.debug) {
        config.logging.level = logging::LogLevel::Debug;
    }
}

}  // namespace ad_silencer::core
