#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace ad_silencer::graceful_shutdown {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the main loop.
// volatile sig_atomic_t keeps the access async-signal-safe.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT, SIGHUP
    volatile sig_atomic_t received = 0;  // Last signal number (for logging)

    void reset() {
        shutdown = 0;
        received = 0;
    }
};

// ========== Shutdown Controller ==========
// Turns pending signal flags into a stop of the main loop.
// Testable without actual signal delivery.

class Controller {
   public:
    using CancelCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    Controller() = default;

    // Set the signal state (tests pass their own instance)
    void setSignalState(SignalState* state) {
        signalState_ = state;
    }

    // Invoked first on shutdown so blocking work (filler waits) is cut short
    void setCancelCallback(CancelCallback cb) {
        cancelCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Process pending signals. Returns true if a signal was processed.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }

    // Last processed signal number (for logging)
    int getLastSignal() const {
        return lastSignal_;
    }

    enum class Action { NONE, SHUTDOWN };
    Action getLastAction() const {
        return lastAction_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};

    CancelCallback cancelCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    Action lastAction_ = Action::NONE;
};

// ========== Signal Handler ==========
// Async-signal-safe handler that only sets flags.
void signalHandler(int sig);

// Global signal state written by signalHandler
SignalState& getGlobalSignalState();

}  // namespace ad_silencer::graceful_shutdown
