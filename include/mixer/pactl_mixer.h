#pragma once

#include "core/process_runner.h"
#include "mixer/mixer_service.h"

#include <functional>
#include <string>
#include <vector>

namespace ad_silencer::mixer {

// Parses the output of `pactl list sink-inputs` (C locale).
std::vector<OutputStream> parseSinkInputs(const std::string& text);

// MixerService backed by the pactl command line tool, which talks to both
// PulseAudio and pipewire-pulse.
class PactlMixer : public MixerService {
   public:
    using Runner = std::function<core::ProcessResult(const std::vector<std::string>&,
                                                     const std::vector<std::string>&)>;

    explicit PactlMixer(std::string pactlPath = "pactl", Runner runner = core::runProcess);

    core::ErrorCode listStreams(std::vector<OutputStream>& out) override;
    core::ErrorCode resolveStreams(const std::string& applicationName,
                                   std::vector<uint32_t>& out) override;
    core::ErrorCode setMute(uint32_t streamIndex, bool muted) override;

   private:
    core::ProcessResult run(const std::vector<std::string>& args);

    std::string pactlPath_;
    Runner runner_;
};

}  // namespace ad_silencer::mixer
