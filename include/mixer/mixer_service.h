#pragma once

#include "core/error_codes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ad_silencer::mixer {

// One application output stream (a PulseAudio/PipeWire sink input).
struct OutputStream {
    uint32_t index = 0;
    std::string applicationName;
    bool muted = false;
};

// Audio mixer collaborator. Mutes individual application streams, never the
// device.
class MixerService {
   public:
    virtual ~MixerService() = default;

    virtual core::ErrorCode listStreams(std::vector<OutputStream>& out) = 0;

    // Identifiers of every stream tagged with applicationName.
    // MIXER_STREAM_NOT_FOUND when the application has no active stream.
    virtual core::ErrorCode resolveStreams(const std::string& applicationName,
                                           std::vector<uint32_t>& out) = 0;

    virtual core::ErrorCode setMute(uint32_t streamIndex, bool muted) = 0;
};

}  // namespace ad_silencer::mixer
