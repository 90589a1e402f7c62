#include "daemon/app/app.h"

#include "coordinator/ad_response_coordinator.h"
#include "daemon/shutdown_manager.h"
#include "detector/state_tracker.h"
#include "filler/alsa_file_player.h"
#include "filler/filler_library.h"
#include "filler/filler_orchestrator.h"
#include "logging/logger.h"
#include "mixer/mute_controller.h"
#include "mixer/pactl_mixer.h"
#include "player/binding_registry.h"
#include "player/mpris_player_service.h"

#include <memory>
#include <string>

namespace ad_silencer::daemon {
namespace {

// Falls back to simple mode when the filler directory is unusable.
void validate_filler_mode(core::AppConfig& config) {
    if (!config.fillerMode()) {
        return;
    }
    auto rc = core::validateFillerDir(config.fillerDir);
    if (rc != core::ErrorCode::OK) {
        LOG_WARN("Filler directory '{}' unusable ({}), running in simple mode", config.fillerDir,
                 core::errorCodeToString(rc));
        config.fillerDir.clear();
    }
}

}  // namespace

App::App(RuntimeState& state) : state_(state) {}

int App::run() {
    auto& config = state_.config;
    validate_filler_mode(config);

    mixer::PactlMixer mixer(config.pactlPath);
    mixer::MuteController muteController(mixer, config.mixerAppName);
    detector::StateTracker tracker;

    player::MprisPlayerService playerService;
    auto rc = playerService.open();
    if (rc != core::ErrorCode::OK) {
        LOG_ERROR("Session bus unavailable ({})", core::errorCodeToString(rc));
        return 1;
    }

    const std::string playerName = config.playerName;
    auto resumePlayer = [&playerService, playerName]() {
        auto playRc = playerService.play(playerName);
        if (playRc != core::ErrorCode::OK) {
            LOG_DEBUG("Resume of '{}' skipped ({})", playerName,
                      core::errorCodeToString(playRc));
        }
    };

    std::unique_ptr<filler::FillerLibrary> library;
    std::unique_ptr<filler::AlsaFilePlayer> filePlayer;
    std::unique_ptr<filler::FillerOrchestrator> orchestrator;
    std::unique_ptr<coordinator::AdResponseCoordinator> responder;
    if (config.fillerMode()) {
        library = std::make_unique<filler::FillerLibrary>(config.fillerDir);
        filePlayer = std::make_unique<filler::AlsaFilePlayer>(config.playbackDevice);
        orchestrator = std::make_unique<filler::FillerOrchestrator>(
            muteController, *library, *filePlayer,
            std::chrono::milliseconds(config.settleDelayMs));
        responder = std::make_unique<coordinator::AdResponseCoordinator>(
            tracker, muteController, *orchestrator, resumePlayer);
    } else {
        responder = std::make_unique<coordinator::AdResponseCoordinator>(tracker, muteController);
    }

    player::BindingRegistry registry(playerService, playerName, *responder);
    playerService.setPresenceHandlers(
        [&registry](const std::string& name) { registry.onAppear(name); },
        [&registry](const std::string& name) { registry.onVanish(name); });

    ShutdownManager::Dependencies shutdownDeps{&state_.flags.running};
    ShutdownManager shutdownManager(shutdownDeps);
    shutdownManager.installSignalHandlers();
    shutdownManager.setCancelCallback([&orchestrator]() {
        if (orchestrator) {
            orchestrator->stop();
        }
    });
    shutdownManager.setCleanupCallback([&responder, &registry]() {
        responder->restoreOnShutdown();
        registry.release();
    });

    LOG_INFO("========================================");
    LOG_INFO("  ad_silencer");
    LOG_INFO("========================================");
    LOG_INFO("Player: {} (mixer app '{}')", playerName, config.mixerAppName);
    if (config.fillerMode()) {
        LOG_INFO("Mode: filler ({}, device {})", config.fillerDir, config.playbackDevice);
    } else {
        LOG_INFO("Mode: simple (mute only)");
    }

    registry.bindIfPresent();
    shutdownManager.notifyReady("Watching " + playerName + " (" +
                                std::string(coordinator::responseModeToString(responder->mode())) +
                                " mode)");

    int exitCode = 0;
    while (state_.flags.running.load()) {
        rc = playerService.dispatch(kReactorPollInterval);
        if (rc != core::ErrorCode::OK) {
            LOG_ERROR("Event loop stopped ({})", core::errorCodeToString(rc));
            exitCode = 1;
            break;
        }
        shutdownManager.tick();
    }

    shutdownManager.runShutdownSequence();
    playerService.close();
    LOG_INFO("Stopped");
    return exitCode;
}

}  // namespace ad_silencer::daemon
