#pragma once

#include "daemon/app/runtime_state.h"

#include <chrono>

namespace ad_silencer::daemon {

// Upper bound for one reactor iteration; also the shutdown-signal latency.
constexpr std::chrono::milliseconds kReactorPollInterval{200};

class App {
   public:
    explicit App(RuntimeState& state);

    // Blocks until a shutdown signal or a fatal bus error. Returns the exit code.
    int run();

   private:
    RuntimeState& state_;
};

}  // namespace ad_silencer::daemon
