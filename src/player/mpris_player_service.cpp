#include "player/mpris_player_service.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <utility>

namespace ad_silencer::player {

namespace {

constexpr const char* kDbusService = "org.freedesktop.DBus";
constexpr const char* kDbusPath = "/org/freedesktop/DBus";
constexpr const char* kDbusInterface = "org.freedesktop.DBus";

constexpr const char* kNameOwnerChangedRule =
    "type='signal',sender='org.freedesktop.DBus',interface='org.freedesktop.DBus',"
    "member='NameOwnerChanged'";
constexpr const char* kPropertiesChangedRule =
    "type='signal',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged',"
    "path='/org/mpris/MediaPlayer2',arg0='org.mpris.MediaPlayer2.Player'";

void freeStrv(char** strv) {
    if (!strv) {
        return;
    }
    for (char** it = strv; *it; ++it) {
        std::free(*it);
    }
    std::free(strv);
}

std::string joinStrv(char** strv) {
    std::string joined;
    if (!strv) {
        return joined;
    }
    for (char** it = strv; *it; ++it) {
        if (**it == '\0') {
            continue;
        }
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += *it;
    }
    return joined;
}

// Reads a variant holding either "s" or "as". Anything else is skipped and
// leaves out untouched.
int readStringVariant(sd_bus_message* message, std::string& out) {
    char type = 0;
    const char* contents = nullptr;
    int r = sd_bus_message_peek_type(message, &type, &contents);
    if (r < 0) {
        return r;
    }
    if (type != SD_BUS_TYPE_VARIANT || !contents) {
        return sd_bus_message_skip(message, nullptr);
    }

    if (std::strcmp(contents, "s") == 0) {
        const char* value = nullptr;
        r = sd_bus_message_read(message, "v", "s", &value);
        if (r >= 0 && value) {
            out = value;
        }
        return r;
    }

    if (std::strcmp(contents, "as") == 0) {
        r = sd_bus_message_enter_container(message, SD_BUS_TYPE_VARIANT, "as");
        if (r < 0) {
            return r;
        }
        char** values = nullptr;
        r = sd_bus_message_read_strv(message, &values);
        if (r >= 0) {
            out = joinStrv(values);
        }
        freeStrv(values);
        if (r < 0) {
            return r;
        }
        return sd_bus_message_exit_container(message);
    }

    return sd_bus_message_skip(message, "v");
}

int readMetadataDict(sd_bus_message* message, TrackMetadata& out) {
    int r = sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) {
        return r;
    }
    while ((r = sd_bus_message_enter_container(message, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        r = sd_bus_message_read(message, "s", &key);
        if (r < 0) {
            return r;
        }
        if (std::strcmp(key, "xesam:title") == 0) {
            r = readStringVariant(message, out.title);
        } else if (std::strcmp(key, "xesam:artist") == 0) {
            r = readStringVariant(message, out.artist);
        } else {
            r = sd_bus_message_skip(message, "v");
        }
        if (r < 0) {
            return r;
        }
        r = sd_bus_message_exit_container(message);
        if (r < 0) {
            return r;
        }
    }
    if (r < 0) {
        return r;
    }
    return sd_bus_message_exit_container(message);
}

core::ErrorCode mapCallError(const sd_bus_error& error) {
    if (sd_bus_error_has_name(&error, "org.freedesktop.DBus.Error.ServiceUnknown") ||
        sd_bus_error_has_name(&error, "org.freedesktop.DBus.Error.NameHasNoOwner")) {
        return core::ErrorCode::PLAYER_NOT_FOUND;
    }
    return core::ErrorCode::PLAYER_CALL_FAILED;
}

class MprisSubscription : public Subscription {
   public:
    MprisSubscription(std::string name, std::string owner, MetadataListener& listener)
        : name_(std::move(name)), owner_(std::move(owner)), listener_(listener) {}

    ~MprisSubscription() override {
        sd_bus_slot_unref(slot_);
    }

    MprisSubscription(const MprisSubscription&) = delete;
    MprisSubscription& operator=(const MprisSubscription&) = delete;

    int attach(sd_bus* bus) {
        return sd_bus_add_match(bus, &slot_, kPropertiesChangedRule,
                                &MprisSubscription::onPropertiesChanged, this);
    }

   private:
    static int onPropertiesChanged(sd_bus_message* message, void* userdata,
                                   sd_bus_error* /*error*/) {
        auto* self = static_cast<MprisSubscription*>(userdata);

        // The match cannot filter on a well-known sender; compare the unique name.
        const char* sender = sd_bus_message_get_sender(message);
        if (!sender || self->owner_ != sender) {
            return 0;
        }

        const char* interface = nullptr;
        if (sd_bus_message_read(message, "s", &interface) < 0 || !interface ||
            std::strcmp(interface, kMprisPlayerInterface) != 0) {
            return 0;
        }

        TrackMetadata metadata;
        if (!readMetadataFromChangedProperties(message, metadata)) {
            return 0;
        }

        LOG_TRACE("[Mpris] {}: artist='{}' title='{}'", self->name_, metadata.artist,
                  metadata.title);
        try {
            self->listener_.onMetadata(metadata);
        } catch (const std::exception& e) {
            LOG_ERROR("[Mpris] Metadata handler for '{}' failed: {}", self->name_, e.what());
        }
        return 0;
    }

    std::string name_;
    std::string owner_;
    MetadataListener& listener_;
    sd_bus_slot* slot_ = nullptr;
};

}  // namespace

std::string playerNameFromBusName(const std::string& busName) {
    const std::size_t prefixLen = std::strlen(kMprisBusPrefix);
    if (busName.size() <= prefixLen || busName.compare(0, prefixLen, kMprisBusPrefix) != 0) {
        return {};
    }
    return busName.substr(prefixLen);
}

bool readMetadataFromChangedProperties(sd_bus_message* message, TrackMetadata& out) {
    bool found = false;
    int r = sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) {
        return false;
    }
    while ((r = sd_bus_message_enter_container(message, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        if (sd_bus_message_read(message, "s", &key) < 0) {
            return false;
        }
        if (std::strcmp(key, "Metadata") == 0) {
            if (sd_bus_message_enter_container(message, SD_BUS_TYPE_VARIANT, "a{sv}") < 0 ||
                readMetadataDict(message, out) < 0 || sd_bus_message_exit_container(message) < 0) {
                return false;
            }
            found = true;
        } else if (sd_bus_message_skip(message, "v") < 0) {
            return false;
        }
        if (sd_bus_message_exit_container(message) < 0) {
            return false;
        }
    }
    if (r < 0) {
        return false;
    }
    sd_bus_message_exit_container(message);
    return found;
}

MprisPlayerService::MprisPlayerService() = default;

MprisPlayerService::~MprisPlayerService() {
    close();
}

core::ErrorCode MprisPlayerService::open() {
    if (eventBus_) {
        return core::ErrorCode::OK;
    }

    int r = sd_bus_open_user(&eventBus_);
    if (r < 0) {
        LOG_ERROR("[Mpris] Cannot connect to session bus: {}", std::strerror(-r));
        eventBus_ = nullptr;
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }
    r = sd_bus_open_user(&commandBus_);
    if (r < 0) {
        LOG_ERROR("[Mpris] Cannot open command connection: {}", std::strerror(-r));
        commandBus_ = nullptr;
        close();
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }

    r = sd_bus_add_match(eventBus_, &nameOwnerSlot_, kNameOwnerChangedRule,
                         &MprisPlayerService::onNameOwnerChanged, this);
    if (r < 0) {
        LOG_ERROR("[Mpris] Cannot watch player presence: {}", std::strerror(-r));
        close();
        return core::ErrorCode::PLAYER_SUBSCRIBE_FAILED;
    }

    LOG_DEBUG("[Mpris] Connected to session bus");
    return core::ErrorCode::OK;
}

void MprisPlayerService::close() {
    nameOwnerSlot_ = sd_bus_slot_unref(nameOwnerSlot_);
    eventBus_ = sd_bus_flush_close_unref(eventBus_);
    std::lock_guard<std::mutex> lock(commandMutex_);
    commandBus_ = sd_bus_flush_close_unref(commandBus_);
}

core::ErrorCode MprisPlayerService::dispatch(std::chrono::milliseconds timeout) {
    if (!eventBus_) {
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }

    while (true) {
        int r = sd_bus_process(eventBus_, nullptr);
        if (r < 0) {
            LOG_ERROR("[Mpris] Bus processing failed: {}", std::strerror(-r));
            return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
        }
        if (r == 0) {
            break;
        }
    }

    const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    int r = sd_bus_wait(eventBus_, static_cast<uint64_t>(usec));
    if (r < 0 && r != -EINTR) {
        LOG_ERROR("[Mpris] Bus wait failed: {}", std::strerror(-r));
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }
    return core::ErrorCode::OK;
}

core::ErrorCode MprisPlayerService::listPlayers(std::vector<std::string>& out) {
    out.clear();
    std::lock_guard<std::mutex> lock(commandMutex_);
    if (!commandBus_) {
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }

    sd_bus_error error = SD_BUS_ERROR_NULL;
    sd_bus_message* reply = nullptr;
    int r = sd_bus_call_method(commandBus_, kDbusService, kDbusPath, kDbusInterface, "ListNames",
                               &error, &reply, "");
    if (r < 0) {
        LOG_DEBUG("[Mpris] ListNames failed: {}", error.message ? error.message : "unknown");
        sd_bus_error_free(&error);
        return core::ErrorCode::PLAYER_CALL_FAILED;
    }

    char** names = nullptr;
    r = sd_bus_message_read_strv(reply, &names);
    if (r >= 0 && names) {
        for (char** it = names; *it; ++it) {
            std::string player = playerNameFromBusName(*it);
            if (!player.empty()) {
                out.push_back(std::move(player));
            }
        }
    }
    freeStrv(names);
    sd_bus_message_unref(reply);
    sd_bus_error_free(&error);
    return r < 0 ? core::ErrorCode::PLAYER_CALL_FAILED : core::ErrorCode::OK;
}

core::ErrorCode MprisPlayerService::resolveOwner(const std::string& name, std::string& owner) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    if (!commandBus_) {
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }

    const std::string busName = kMprisBusPrefix + name;
    sd_bus_error error = SD_BUS_ERROR_NULL;
    sd_bus_message* reply = nullptr;
    int r = sd_bus_call_method(commandBus_, kDbusService, kDbusPath, kDbusInterface,
                               "GetNameOwner", &error, &reply, "s", busName.c_str());
    if (r < 0) {
        auto rc = mapCallError(error);
        sd_bus_error_free(&error);
        return rc;
    }

    const char* unique = nullptr;
    r = sd_bus_message_read(reply, "s", &unique);
    if (r >= 0 && unique) {
        owner = unique;
    }
    sd_bus_message_unref(reply);
    sd_bus_error_free(&error);
    return owner.empty() ? core::ErrorCode::PLAYER_NOT_FOUND : core::ErrorCode::OK;
}

std::unique_ptr<Subscription> MprisPlayerService::subscribe(const std::string& name,
                                                            MetadataListener& listener) {
    if (!eventBus_) {
        return nullptr;
    }

    std::string owner;
    auto rc = resolveOwner(name, owner);
    if (rc != core::ErrorCode::OK) {
        LOG_DEBUG("[Mpris] Cannot resolve owner of '{}' ({})", name, core::errorCodeToString(rc));
        return nullptr;
    }

    auto subscription = std::make_unique<MprisSubscription>(name, owner, listener);
    int r = subscription->attach(eventBus_);
    if (r < 0) {
        LOG_ERROR("[Mpris] Cannot subscribe to '{}': {}", name, std::strerror(-r));
        return nullptr;
    }
    LOG_DEBUG("[Mpris] Subscribed to '{}' ({})", name, owner);
    return subscription;
}

void MprisPlayerService::setPresenceHandlers(PresenceHandler onAppear, PresenceHandler onVanish) {
    onAppear_ = std::move(onAppear);
    onVanish_ = std::move(onVanish);
}

core::ErrorCode MprisPlayerService::play(const std::string& name) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    if (!commandBus_) {
        return core::ErrorCode::PLAYER_BUS_UNAVAILABLE;
    }

    const std::string busName = kMprisBusPrefix + name;
    sd_bus_error error = SD_BUS_ERROR_NULL;
    int r = sd_bus_call_method(commandBus_, busName.c_str(), kMprisObjectPath,
                               kMprisPlayerInterface, "Play", &error, nullptr, "");
    if (r < 0) {
        auto rc = mapCallError(error);
        LOG_DEBUG("[Mpris] Play on '{}' failed: {}", name,
                  error.message ? error.message : std::strerror(-r));
        sd_bus_error_free(&error);
        return rc;
    }
    sd_bus_error_free(&error);
    return core::ErrorCode::OK;
}

int MprisPlayerService::onNameOwnerChanged(sd_bus_message* message, void* userdata,
                                           sd_bus_error* /*error*/) {
    auto* self = static_cast<MprisPlayerService*>(userdata);

    const char* busName = nullptr;
    const char* oldOwner = nullptr;
    const char* newOwner = nullptr;
    if (sd_bus_message_read(message, "sss", &busName, &oldOwner, &newOwner) < 0 || !busName) {
        return 0;
    }

    std::string player = playerNameFromBusName(busName);
    if (player.empty()) {
        return 0;
    }

    const bool hadOwner = oldOwner && *oldOwner;
    const bool hasOwner = newOwner && *newOwner;
    try {
        if (hadOwner && self->onVanish_) {
            LOG_DEBUG("[Mpris] Player vanished: {}", player);
            self->onVanish_(player);
        }
        if (hasOwner && self->onAppear_) {
            LOG_DEBUG("[Mpris] Player appeared: {}", player);
            self->onAppear_(player);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Mpris] Presence handler for '{}' failed: {}", player, e.what());
    }
    return 0;
}

}  // namespace ad_silencer::player
