#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <systemd/sd-daemon.h>
#include <utility>

namespace ad_silencer::daemon {

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(deps) {
    if (!deps_.runningFlag) {
        throw std::invalid_argument("ShutdownManager requires a running flag");
    }

    controller_.setSignalState(&graceful_shutdown::getGlobalSignalState());
    controller_.setLogCallback([](const char* message) { LOG_INFO("{}", message); });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, graceful_shutdown::signalHandler);
    std::signal(SIGTERM, graceful_shutdown::signalHandler);
    std::signal(SIGHUP, graceful_shutdown::signalHandler);
}

void ShutdownManager::setCancelCallback(std::function<void()> cb) {
    controller_.setCancelCallback(std::move(cb));
}

void ShutdownManager::setCleanupCallback(std::function<void()> cb) {
    cleanupCallback_ = std::move(cb);
}

void ShutdownManager::notifyReady(const std::string& status) {
    if (readyNotified_) {
        return;
    }

    uint64_t usec = 0;
    int r = sd_watchdog_enabled(0, &usec);
    if (r > 0 && usec > 0) {
        // Ping at half the deadline
        watchdogInterval_ = std::chrono::microseconds(usec / 2);
        LOG_DEBUG("systemd: watchdog every {} ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(watchdogInterval_).count());
    } else if (r < 0) {
        LOG_WARN("systemd: invalid watchdog settings ({})", r);
    }

    sendReadyNotify(status);
    lastWatchdog_ = std::chrono::steady_clock::now();
}

void ShutdownManager::tick() {
    if (controller_.processPendingSignals()) {
        deps_.runningFlag->store(controller_.isRunning());
    }
    if (!readyNotified_ || !controller_.isRunning() ||
        watchdogInterval_ == std::chrono::microseconds::zero()) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - lastWatchdog_ >= watchdogInterval_) {
        sendWatchdog();
        lastWatchdog_ = now;
    }
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;

    LOG_INFO("Shutting down...");
    sendStoppingNotify();

    if (cleanupCallback_) {
        try {
            cleanupCallback_();
        } catch (const std::exception& e) {
            LOG_ERROR("Shutdown cleanup failed: {}", e.what());
        }
    }
}

bool ShutdownManager::isRunning() const {
    return controller_.isRunning();
}

void ShutdownManager::sendWatchdog() {
    sd_notify(0, "WATCHDOG=1");
}

void ShutdownManager::sendReadyNotify(const std::string& status) {
    const std::string message = "READY=1\nSTATUS=" + status + "\n";
    sd_notify(0, message.c_str());
    readyNotified_ = true;
    LOG_DEBUG("systemd: Notified READY=1");
}

void ShutdownManager::sendStoppingNotify() {
    if (!stoppingNotified_) {
        sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
        stoppingNotified_ = true;
        LOG_DEBUG("systemd: Notified STOPPING=1");
    }
}

}  // namespace ad_silencer::daemon
