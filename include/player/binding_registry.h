#pragma once

#include "player/player_service.h"

#include <memory>
#include <string>

namespace ad_silencer::player {

// Keeps exactly one metadata subscription alive for the tracked player while it
// is on the bus, and re-arms after every disappearance.
class BindingRegistry {
   public:
    BindingRegistry(PlayerService& service, std::string trackedName, MetadataListener& listener);

    void onAppear(const std::string& name);
    void onVanish(const std::string& name);

    // Binds if the tracked player is already running. Appearance notifications
    // only report changes, so this is needed once at startup.
    void bindIfPresent();

    // Drops the subscription without waiting for a vanish notification.
    void release();

    bool isBound() const {
        return bound_;
    }
    const std::string& trackedName() const {
        return trackedName_;
    }

   private:
    PlayerService& service_;
    std::string trackedName_;
    MetadataListener& listener_;
    std::unique_ptr<Subscription> subscription_;
    bool bound_ = false;
};

}  // namespace ad_silencer::player
