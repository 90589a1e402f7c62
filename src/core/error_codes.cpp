#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace ad_silencer::core {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Mixer
    {ErrorCode::MIXER_COMMAND_FAILED, "MIXER_COMMAND_FAILED"},
    {ErrorCode::MIXER_STREAM_NOT_FOUND, "MIXER_STREAM_NOT_FOUND"},

    // Player
    {ErrorCode::PLAYER_BUS_UNAVAILABLE, "PLAYER_BUS_UNAVAILABLE"},
    {ErrorCode::PLAYER_NOT_FOUND, "PLAYER_NOT_FOUND"},
    {ErrorCode::PLAYER_CALL_FAILED, "PLAYER_CALL_FAILED"},
    {ErrorCode::PLAYER_SUBSCRIBE_FAILED, "PLAYER_SUBSCRIBE_FAILED"},

    // Filler playback
    {ErrorCode::PLAYBACK_LIBRARY_EMPTY, "PLAYBACK_LIBRARY_EMPTY"},
    {ErrorCode::PLAYBACK_FILE_OPEN_FAILED, "PLAYBACK_FILE_OPEN_FAILED"},
    {ErrorCode::PLAYBACK_DEVICE_OPEN_FAILED, "PLAYBACK_DEVICE_OPEN_FAILED"},

    // Validation
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_NOT_A_DIRECTORY, "VALIDATION_NOT_A_DIRECTORY"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isMixerError(code)) {
        return "mixer";
    }
    if (isPlayerError(code)) {
        return "player";
    }
    if (isPlaybackError(code)) {
        return "playback";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace ad_silencer::core
