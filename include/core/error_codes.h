#ifndef AD_SILENCER_ERROR_CODES_H
#define AD_SILENCER_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace ad_silencer::core {

/**
 * @brief Error codes shared by the collaborator adapters.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Mixer (pactl)
 * - 0x2xxx: Player (MPRIS / D-Bus)
 * - 0x3xxx: Filler playback (sndfile / ALSA / library)
 * - 0x5xxx: Validation (config, arguments)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Mixer (0x1000)
    MIXER_COMMAND_FAILED = 0x1001,
    MIXER_STREAM_NOT_FOUND = 0x1002,

    // Player (0x2000)
    PLAYER_BUS_UNAVAILABLE = 0x2001,
    PLAYER_NOT_FOUND = 0x2002,
    PLAYER_CALL_FAILED = 0x2003,
    PLAYER_SUBSCRIBE_FAILED = 0x2004,

    // Filler playback (0x3000)
    PLAYBACK_LIBRARY_EMPTY = 0x3001,
    PLAYBACK_FILE_OPEN_FAILED = 0x3002,
    PLAYBACK_DEVICE_OPEN_FAILED = 0x3003,

    // Validation (0x5000)
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_NOT_A_DIRECTORY = 0x5003,

    // Internal (0xF000) - Reserved for fallback
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "MIXER_STREAM_NOT_FOUND"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "mixer"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isMixerError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isPlayerError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isPlaybackError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if the failed operation may succeed on the next event.
 *
 * A missing stream or player is expected while the endpoint is idle or
 * restarting; the state machine simply tries again next time.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::MIXER_STREAM_NOT_FOUND || code == ErrorCode::MIXER_COMMAND_FAILED ||
           code == ErrorCode::PLAYER_NOT_FOUND || code == ErrorCode::PLAYER_CALL_FAILED;
}

}  // namespace ad_silencer::core

#endif  // AD_SILENCER_ERROR_CODES_H
