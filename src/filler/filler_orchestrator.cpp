#include "filler/filler_orchestrator.h"

#include "logging/logger.h"

#include <exception>
#include <filesystem>
#include <utility>

namespace ad_silencer::filler {

namespace {

// Releases the job guard when the worker leaves runJob, whatever the path.
class JobGuardRelease {
   public:
    explicit JobGuardRelease(std::function<void()> release) : release_(std::move(release)) {}
    ~JobGuardRelease() {
        release_();
    }

    JobGuardRelease(const JobGuardRelease&) = delete;
    JobGuardRelease& operator=(const JobGuardRelease&) = delete;

   private:
    std::function<void()> release_;
};

}  // namespace

FillerOrchestrator::FillerOrchestrator(mixer::MuteController& muteController,
                                       FillerLibrary& library, PlaybackService& playback,
                                       std::chrono::milliseconds settleDelay,
                                       std::chrono::milliseconds primeTimeout)
    : muteController_(muteController),
      library_(library),
      playback_(playback),
      settleDelay_(settleDelay),
      primeTimeout_(primeTimeout) {}

FillerOrchestrator::~FillerOrchestrator() {
    stop();
}

bool FillerOrchestrator::tryStart(AdEndCallback onAdEnd) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            LOG_DEBUG("[FillerOrchestrator] Stopped, ignoring ad");
            return false;
        }
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LOG_DEBUG("[FillerOrchestrator] Filler already running, ad dropped");
        return false;
    }

    std::lock_guard<std::mutex> workerLock(workerMutex_);
    // The previous worker has already released the guard; reap it.
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this, callback = std::move(onAdEnd)]() { runJob(callback); });
    return true;
}

bool FillerOrchestrator::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !isRunning(); });
}

void FillerOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> workerLock(workerMutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool FillerOrchestrator::waitCancellable(std::chrono::milliseconds duration) {
    if (duration <= std::chrono::milliseconds::zero()) {
        return true;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

bool FillerOrchestrator::waitForDuration(double& seconds) {
    const auto deadline = std::chrono::steady_clock::now() + primeTimeout_;
    while (true) {
        seconds = playback_.durationSeconds();
        if (seconds > 0.0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            seconds = 0.0;
            return true;
        }
        if (!waitCancellable(kDurationPollInterval)) {
            return false;
        }
    }
}

void FillerOrchestrator::finishJob() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
}

void FillerOrchestrator::playFiller(const AdEndCallback& onAdEnd) {
    std::filesystem::path clip;
    auto rc = library_.pick(clip);
    if (rc != core::ErrorCode::OK) {
        LOG_WARN("[FillerOrchestrator] No filler in {} ({})", library_.directory().string(),
                 core::errorCodeToString(rc));
        return;
    }

    rc = playback_.start(clip.string());
    if (rc != core::ErrorCode::OK) {
        LOG_WARN("[FillerOrchestrator] Cannot play {} ({})", clip.string(),
                 core::errorCodeToString(rc));
        return;
    }

    const auto startedAt = std::chrono::steady_clock::now();
    double duration = 0.0;
    bool completed = waitCancellable(settleDelay_) && waitForDuration(duration);
    if (completed && duration <= 0.0) {
        LOG_WARN("[FillerOrchestrator] {} never started playing within {} ms", clip.string(),
                 primeTimeout_.count());
        playback_.stop();
        return;
    }
    if (completed) {
        LOG_DEBUG("[FillerOrchestrator] Filler {} lasts {:.2f} s", clip.filename().string(),
                  duration);
        const auto total = std::chrono::milliseconds(static_cast<long long>(duration * 1000.0));
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt);
        completed = waitCancellable(total - elapsed);
    }
    if (!completed) {
        LOG_INFO("[FillerOrchestrator] Filler cut short by shutdown");
    }
    playback_.stop();

    if (onAdEnd) {
        onAdEnd();
    }
}

void FillerOrchestrator::runJob(const AdEndCallback& onAdEnd) {
    JobGuardRelease guard([this]() { finishJob(); });

    try {
        auto rc = muteController_.mute();
        if (rc != core::ErrorCode::OK) {
            LOG_DEBUG("[FillerOrchestrator] Mute not applied ({})", core::errorCodeToString(rc));
        }
        playFiller(onAdEnd);
    } catch (const std::exception& e) {
        LOG_ERROR("[FillerOrchestrator] Filler job failed: {}", e.what());
        playback_.stop();
    }

    try {
        auto rc = muteController_.unmute();
        if (rc != core::ErrorCode::OK) {
            LOG_DEBUG("[FillerOrchestrator] Unmute not applied ({})",
                      core::errorCodeToString(rc));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[FillerOrchestrator] Unmute after filler failed: {}", e.what());
    }
    LOG_DEBUG("[FillerOrchestrator] Filler job finished");
}

}  // namespace ad_silencer::filler
