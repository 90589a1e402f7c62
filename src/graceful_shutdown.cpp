#include "graceful_shutdown.h"

#include <cstdio>

namespace ad_silencer::graceful_shutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Async-signal-safe: ONLY sets flags
void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;
    if (!signalState_->shutdown) {
        return false;
    }

    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;
    lastAction_ = Action::SHUTDOWN;

    if (logCallback_) {
        char buf[64];
        if (lastSignal_ == SIGHUP) {
            snprintf(buf, sizeof(buf), "Received SIGHUP (signal %d), shutting down", lastSignal_);
        } else {
            snprintf(buf, sizeof(buf), "Received signal %d, shutting down", lastSignal_);
        }
        logCallback_(buf);
    }

    if (cancelCallback_) {
        cancelCallback_();
    }
    running_ = false;
    return true;
}

}  // namespace ad_silencer::graceful_shutdown
