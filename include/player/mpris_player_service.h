/**
 * @file mpris_player_service.h
 * @brief PlayerService over the MPRIS D-Bus interface (sd-bus)
 *
 * Two session-bus connections are used:
 * - the event connection is owned by the reactor thread; it carries the
 *   NameOwnerChanged and PropertiesChanged matches and is pumped by dispatch();
 * - the command connection serves synchronous method calls (ListNames,
 *   GetNameOwner, Play) and is serialized by a mutex so the filler worker can
 *   resume the player while the reactor keeps running.
 */

#pragma once

#include "player/player_service.h"

#include <chrono>
#include <mutex>
#include <string>
#include <systemd/sd-bus.h>
#include <vector>

namespace ad_silencer::player {

constexpr const char* kMprisBusPrefix = "org.mpris.MediaPlayer2.";
constexpr const char* kMprisObjectPath = "/org/mpris/MediaPlayer2";
constexpr const char* kMprisPlayerInterface = "org.mpris.MediaPlayer2.Player";

// "org.mpris.MediaPlayer2.spotify" -> "spotify"; empty for non-MPRIS names
std::string playerNameFromBusName(const std::string& busName);

// Reads the a{sv} PropertiesChanged payload after the interface name. Returns
// true when it carried a Metadata entry.
bool readMetadataFromChangedProperties(sd_bus_message* message, TrackMetadata& out);

class MprisPlayerService : public PlayerService {
   public:
    MprisPlayerService();
    ~MprisPlayerService() override;

    MprisPlayerService(const MprisPlayerService&) = delete;
    MprisPlayerService& operator=(const MprisPlayerService&) = delete;

    core::ErrorCode open();
    void close();

    // Processes pending bus traffic, then waits up to timeout for more.
    core::ErrorCode dispatch(std::chrono::milliseconds timeout);

    core::ErrorCode listPlayers(std::vector<std::string>& out) override;
    std::unique_ptr<Subscription> subscribe(const std::string& name,
                                            MetadataListener& listener) override;
    void setPresenceHandlers(PresenceHandler onAppear, PresenceHandler onVanish) override;
    core::ErrorCode play(const std::string& name) override;

   private:
    static int onNameOwnerChanged(sd_bus_message* message, void* userdata, sd_bus_error* error);

    core::ErrorCode resolveOwner(const std::string& name, std::string& owner);

    sd_bus* eventBus_ = nullptr;
    sd_bus* commandBus_ = nullptr;
    sd_bus_slot* nameOwnerSlot_ = nullptr;
    std::mutex commandMutex_;
    PresenceHandler onAppear_;
    PresenceHandler onVanish_;
};

}  // namespace ad_silencer::player
