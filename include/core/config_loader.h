#ifndef AD_SILENCER_CONFIG_LOADER_H
#define AD_SILENCER_CONFIG_LOADER_H

#include "core/error_codes.h"
#include "logging/logger.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace ad_silencer::core {

constexpr const char* DEFAULT_CONFIG_FILE = "ad_silencer.json";

constexpr const char* ENV_DEBUG = "AD_SILENCER_DEBUG";
constexpr const char* ENV_PLAYER = "AD_SILENCER_PLAYER";
constexpr const char* ENV_FILLER_DIR = "AD_SILENCER_FILLER_DIR";

struct AppConfig {
    std::string playerName = "spotify";     // MPRIS short name (org.mpris.MediaPlayer2.<name>)
    std::string mixerAppName = "Spotify";   // application.name of the sink input(s)
    std::string fillerDir = "";             // Empty = simple mode
    int settleDelayMs = 500;                // Delay before the filler duration is sampled
    std::string playbackDevice = "default"; // ALSA PCM for filler clips
    std::string lockName = "ad_silencer";   // Abstract socket used as instance lock
    std::string pactlPath = "pactl";

    logging::LogConfig logging;

    bool fillerMode() const {
        return !fillerDir.empty();
    }
};

// "1", "true", "yes", "on" (case-insensitive)
bool isTruthy(std::string_view value);

// Resets outConfig to defaults, then applies the JSON file. Returns false when
// the file is missing or unparsable (outConfig keeps the defaults).
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// AD_SILENCER_DEBUG, AD_SILENCER_PLAYER and AD_SILENCER_FILLER_DIR.
void applyEnvironmentOverrides(AppConfig& config);

// OK for an existing directory.
ErrorCode validateFillerDir(const std::filesystem::path& dir);

}  // namespace ad_silencer::core

#endif  // AD_SILENCER_CONFIG_LOADER_H
