#include "core/app_options.h"
#include "core/config_loader.h"
#include "daemon/app/app.h"
#include "daemon/core/instance_lock.h"
#include "logging/logger.h"

#include <filesystem>
#include <string>
#include <unistd.h>

int main(int argc, char* argv[]) {
    using namespace ad_silencer;

    // stderr-only logger until the config has been read
    logging::initializeEarly();

    core::AppOptions options;
    bool showHelp = false;
    std::string error;
    if (!core::parseArgs(argc, argv, options, showHelp, error)) {
        if (showHelp) {
            return 0;
        }
        LOG_ERROR("{}", error);
        return 1;
    }

    ad_silencer::daemon::RuntimeState state;
    if (options.configPathGiven && !std::filesystem::exists(options.configPath)) {
        LOG_ERROR("Config file not found: {}", options.configPath);
        return 1;
    }
    if (!core::loadAppConfig(options.configPath, state.config, options.configPathGiven) &&
        options.configPathGiven) {
        LOG_WARN("Config: {} unusable, continuing with defaults", options.configPath);
    }
    core::applyEnvironmentOverrides(state.config);
    core::applyOptions(options, state.config);

    if (!logging::reconfigure(state.config.logging)) {
        return 1;
    }

    bool alreadyRunning = false;
    auto lock =
        ad_silencer::daemon::InstanceLock::tryAcquire(state.config.lockName, alreadyRunning);
    if (!lock) {
        logging::shutdown();
        return alreadyRunning ? 0 : 1;
    }
    LOG_DEBUG("PID: {}", getpid());

    ad_silencer::daemon::App app(state);
    int exitCode = app.run();

    logging::shutdown();
    return exitCode;
}
