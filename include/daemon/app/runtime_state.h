#pragma once

#include "core/config_loader.h"

#include <atomic>

namespace ad_silencer::daemon {

struct RuntimeFlags {
    std::atomic<bool> running{true};
};

struct RuntimeState {
    core::AppConfig config;
    RuntimeFlags flags;
};

}  // namespace ad_silencer::daemon
