/**
 * @file filler_orchestrator.h
 * @brief Runs one "mute, play filler, resume, unmute" job at a time
 *
 * A job is started from the event loop and executed on a worker thread:
 *   mute -> pick clip -> start playback -> settle delay -> sample duration ->
 *   wait remaining duration -> onAdEnd -> unmute -> release guard
 *
 * A backend reports a duration of 0 until its output is primed. The duration is
 * re-sampled every kDurationPollInterval until it is known or primeTimeout has
 * passed; a clip that never primes is treated as failed playback.
 *
 * The guard is released and the stream unmuted on every path, including a
 * missing clip, a playback failure, cancellation by stop() and exceptions
 * thrown by the job.
 */

#pragma once

#include "filler/filler_library.h"
#include "filler/playback_service.h"
#include "mixer/mute_controller.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace ad_silencer::filler {

constexpr std::chrono::milliseconds kDefaultSettleDelay{500};
constexpr std::chrono::milliseconds kDefaultPrimeTimeout{3000};
constexpr std::chrono::milliseconds kDurationPollInterval{20};

class FillerOrchestrator {
   public:
    using AdEndCallback = std::function<void()>;

    FillerOrchestrator(mixer::MuteController& muteController, FillerLibrary& library,
                       PlaybackService& playback,
                       std::chrono::milliseconds settleDelay = kDefaultSettleDelay,
                       std::chrono::milliseconds primeTimeout = kDefaultPrimeTimeout);
    ~FillerOrchestrator();

    FillerOrchestrator(const FillerOrchestrator&) = delete;
    FillerOrchestrator& operator=(const FillerOrchestrator&) = delete;

    // Returns false (and does nothing) when a job is already in flight or the
    // orchestrator has been stopped.
    bool tryStart(AdEndCallback onAdEnd);

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // True once no job is in flight.
    bool waitForIdle(std::chrono::milliseconds timeout);

    // Cancels the pending wait of the current job, joins the worker and refuses
    // further jobs. The cancelled job still resumes and unmutes.
    void stop();

    std::chrono::milliseconds settleDelay() const {
        return settleDelay_;
    }

   private:
    void runJob(const AdEndCallback& onAdEnd);
    void playFiller(const AdEndCallback& onAdEnd);
    // false when cancelled
    bool waitCancellable(std::chrono::milliseconds duration);
    // false when cancelled; seconds stays 0 if the backend never primed
    bool waitForDuration(double& seconds);
    void finishJob();

    mixer::MuteController& muteController_;
    FillerLibrary& library_;
    PlaybackService& playback_;
    std::chrono::milliseconds settleDelay_;
    std::chrono::milliseconds primeTimeout_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex workerMutex_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace ad_silencer::filler
