#pragma once

#include "core/error_codes.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ad_silencer::player {

struct TrackMetadata {
    std::string artist;  // multiple artists are joined with ", "
    std::string title;
};

// Receives metadata notifications for one subscribed player, in delivery order.
class MetadataListener {
   public:
    virtual ~MetadataListener() = default;

    virtual void onMetadata(const TrackMetadata& metadata) = 0;
};

// Live metadata subscription. Destroying it detaches the listener.
class Subscription {
   public:
    virtual ~Subscription() = default;
};

// Player discovery/subscription collaborator. Players are addressed by their
// short name (e.g. "spotify" for org.mpris.MediaPlayer2.spotify).
class PlayerService {
   public:
    using PresenceHandler = std::function<void(const std::string& name)>;

    virtual ~PlayerService() = default;

    virtual core::ErrorCode listPlayers(std::vector<std::string>& out) = 0;

    // nullptr on failure. The listener must outlive the returned subscription.
    virtual std::unique_ptr<Subscription> subscribe(const std::string& name,
                                                    MetadataListener& listener) = 0;

    virtual void setPresenceHandlers(PresenceHandler onAppear, PresenceHandler onVanish) = 0;

    // Resume playback. May be called from a thread other than the event loop.
    virtual core::ErrorCode play(const std::string& name) = 0;
};

}  // namespace ad_silencer::player
