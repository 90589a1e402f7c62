#include "player/binding_registry.h"

#include "logging/logger.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace ad_silencer::player {

BindingRegistry::BindingRegistry(PlayerService& service, std::string trackedName,
                                 MetadataListener& listener)
    : service_(service), trackedName_(std::move(trackedName)), listener_(listener) {}

void BindingRegistry::onAppear(const std::string& name) {
    if (name != trackedName_ || bound_) {
        return;
    }

    auto subscription = service_.subscribe(name, listener_);
    if (!subscription) {
        LOG_WARN("[BindingRegistry] Failed to subscribe to '{}', waiting for next appearance",
                 name);
        return;
    }
    subscription_ = std::move(subscription);
    bound_ = true;
    LOG_INFO("[BindingRegistry] Bound to player '{}'", name);
}

void BindingRegistry::onVanish(const std::string& name) {
    if (name != trackedName_ || !bound_) {
        return;
    }
    subscription_.reset();
    bound_ = false;
    LOG_INFO("[BindingRegistry] Player '{}' vanished", name);
}

void BindingRegistry::bindIfPresent() {
    std::vector<std::string> players;
    auto rc = service_.listPlayers(players);
    if (rc != core::ErrorCode::OK) {
        LOG_WARN("[BindingRegistry] Cannot enumerate players ({})", core::errorCodeToString(rc));
        return;
    }
    if (std::find(players.begin(), players.end(), trackedName_) != players.end()) {
        onAppear(trackedName_);
    } else {
        LOG_INFO("[BindingRegistry] Player '{}' not running yet", trackedName_);
    }
}

void BindingRegistry::release() {
    subscription_.reset();
    bound_ = false;
}

}  // namespace ad_silencer::player
