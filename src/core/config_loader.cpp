#include "core/config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace ad_silencer::core {

static constexpr int kMinSettleDelayMs = 50;
static constexpr int kMaxSettleDelayMs = 10000;

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isTruthy(std::string_view value) {
    const std::string normalized = toLower(std::string(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" ||
           normalized == "on";
}

static void applyLoggingSection(const nlohmann::json& section, logging::LogConfig& out,
                                bool verbose) {
    try {
        if (section.contains("level") && section["level"].is_string()) {
            out.level = logging::stringToLevel(section["level"].get<std::string>());
        }
        if (section.contains("filePath") && section["filePath"].is_string()) {
            out.filePath = section["filePath"].get<std::string>();
        }
        if (section.contains("maxFileSize")) {
            out.maxFileSize = section["maxFileSize"].get<std::size_t>();
        }
        if (section.contains("maxBackups")) {
            out.maxBackups = section["maxBackups"].get<std::size_t>();
        }
        if (section.contains("consoleOutput")) {
            out.consoleOutput = section["consoleOutput"].get<bool>();
        }
        if (section.contains("coloredOutput")) {
            out.coloredOutput = section["coloredOutput"].get<bool>();
        }
        if (section.contains("pattern") && section["pattern"].is_string()) {
            out.pattern = section["pattern"].get<std::string>();
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
        }
        out = logging::LogConfig{};
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("playerName") && j["playerName"].is_string()) {
            outConfig.playerName = j["playerName"].get<std::string>();
        }
        if (j.contains("mixerAppName") && j["mixerAppName"].is_string()) {
            outConfig.mixerAppName = j["mixerAppName"].get<std::string>();
        }
        if (j.contains("fillerDir") && j["fillerDir"].is_string()) {
            outConfig.fillerDir = j["fillerDir"].get<std::string>();
        }
        if (j.contains("settleDelayMs")) {
            outConfig.settleDelayMs = j["settleDelayMs"].get<int>();
        }
        if (j.contains("playbackDevice") && j["playbackDevice"].is_string()) {
            outConfig.playbackDevice = j["playbackDevice"].get<std::string>();
        }
        if (j.contains("lockName") && j["lockName"].is_string()) {
            outConfig.lockName = j["lockName"].get<std::string>();
        }
        if (j.contains("pactlPath") && j["pactlPath"].is_string()) {
            outConfig.pactlPath = j["pactlPath"].get<std::string>();
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            applyLoggingSection(j["logging"], outConfig.logging, verbose);
        }

        outConfig.settleDelayMs =
            std::clamp(outConfig.settleDelayMs, kMinSettleDelayMs, kMaxSettleDelayMs);
        if (outConfig.playerName.empty()) {
            if (verbose) {
                LOG_WARN("Config: Empty playerName, using 'spotify'");
            }
            outConfig.playerName = AppConfig{}.playerName;
        }
        if (outConfig.lockName.empty()) {
            outConfig.lockName = AppConfig{}.lockName;
        }

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

void applyEnvironmentOverrides(AppConfig& config) {
    if (const char* debug = std::getenv(ENV_DEBUG)) {
        if (isTruthy(debug)) {
            config.logging.level = logging::LogLevel::Debug;
        }
    }
    if (const char* player = std::getenv(ENV_PLAYER)) {
        if (*player != '\0') {
            config.playerName = player;
        }
    }
    if (const char* fillerDir = std::getenv(ENV_FILLER_DIR)) {
        config.fillerDir = fillerDir;
    }
}

ErrorCode validateFillerDir(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec) || ec) {
        return ErrorCode::VALIDATION_FILE_NOT_FOUND;
    }
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return ErrorCode::VALIDATION_NOT_A_DIRECTORY;
    }
    return ErrorCode::OK;
}

}  // namespace ad_silencer::core
