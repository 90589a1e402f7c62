#pragma once

#include "detector/state_tracker.h"
#include "filler/filler_orchestrator.h"
#include "mixer/mute_controller.h"
#include "player/player_service.h"

#include <string_view>

namespace ad_silencer::coordinator {

enum class ResponseMode {
    Simple,  // mute for the length of the ad
    Filler,  // mute and play a filler clip, then resume
};

std::string_view responseModeToString(ResponseMode mode);

// Metadata listener for the tracked player. Feeds every notification through
// the StateTracker and reacts to ad starts/ends according to the mode chosen at
// construction.
class AdResponseCoordinator : public player::MetadataListener {
   public:
    // Simple mode.
    AdResponseCoordinator(detector::StateTracker& tracker, mixer::MuteController& muteController);

    // Filler mode. onAdEnd runs on the filler worker after the clip.
    AdResponseCoordinator(detector::StateTracker& tracker, mixer::MuteController& muteController,
                          filler::FillerOrchestrator& orchestrator,
                          filler::FillerOrchestrator::AdEndCallback onAdEnd);

    void onMetadata(const player::TrackMetadata& metadata) override;

    // Applies one tracker observation. No-op unless observation.changed.
    void handle(const detector::Observation& observation);

    // Leaves the player audible when the daemon stops.
    void restoreOnShutdown();

    ResponseMode mode() const {
        return mode_;
    }

   private:
    void handleSimple(const detector::Observation& observation);
    void handleFiller(const detector::Observation& observation);

    detector::StateTracker& tracker_;
    mixer::MuteController& muteController_;
    filler::FillerOrchestrator* orchestrator_ = nullptr;
    filler::FillerOrchestrator::AdEndCallback onAdEnd_;
    ResponseMode mode_;
};

}  // namespace ad_silencer::coordinator
