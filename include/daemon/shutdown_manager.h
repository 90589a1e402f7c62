#pragma once

#include "graceful_shutdown.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace ad_silencer::daemon {

class ShutdownManager {
   public:
    struct Dependencies {
        std::atomic<bool>* runningFlag = nullptr;
    };

    explicit ShutdownManager(Dependencies deps);

    // SIGINT, SIGTERM and SIGHUP all request shutdown
    void installSignalHandlers();

    // Called from the signal-processing path before the loop quits
    void setCancelCallback(std::function<void()> cb);
    // Runs once inside runShutdownSequence()
    void setCleanupCallback(std::function<void()> cb);

    // systemd notifications. Also reads the watchdog interval of the unit.
    void notifyReady(const std::string& status);

    // Periodic processing (called from the main loop)
    void tick();

    void runShutdownSequence();

    bool isRunning() const;

    // Zero when the unit has no WatchdogSec=
    std::chrono::microseconds watchdogInterval() const {
        return watchdogInterval_;
    }

   private:
    void sendWatchdog();
    void sendReadyNotify(const std::string& status);
    void sendStoppingNotify();

    Dependencies deps_;
    graceful_shutdown::Controller controller_;
    std::function<void()> cleanupCallback_;

    bool readyNotified_{false};
    bool stoppingNotified_{false};
    bool sequenceRan_{false};
    std::chrono::microseconds watchdogInterval_{0};
    std::chrono::steady_clock::time_point lastWatchdog_{};
};

}  // namespace ad_silencer::daemon
