#include "player/binding_registry.h"
#include "support/fake_services.h"

#include <gtest/gtest.h>
#include <vector>

using namespace ad_silencer;
using ad_silencer::testing::FakePlayerService;

namespace {

class RecordingListener : public player::MetadataListener {
   public:
    void onMetadata(const player::TrackMetadata& metadata) override {
        received.push_back(metadata);
    }

    std::vector<player::TrackMetadata> received;
};

}  // namespace

class BindingRegistryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        service_.setPresenceHandlers([this](const std::string& n) { registry_.onAppear(n); },
                                     [this](const std::string& n) { registry_.onVanish(n); });
    }

    FakePlayerService service_;
    RecordingListener listener_;
    player::BindingRegistry registry_{service_, "spotify", listener_};
};

TEST_F(BindingRegistryTest, StartsUnbound) {
    EXPECT_FALSE(registry_.isBound());
    EXPECT_EQ(registry_.trackedName(), "spotify");
    EXPECT_EQ(service_.subscribeCalls, 0);
}

TEST_F(BindingRegistryTest, AppearanceOfTrackedPlayerBinds) {
    service_.appear("spotify");

    EXPECT_TRUE(registry_.isBound());
    EXPECT_EQ(service_.subscribedName, "spotify");
    EXPECT_EQ(service_.activeSubscriptions, 1);

    ASSERT_TRUE(service_.emit("A", "Song"));
    ASSERT_EQ(listener_.received.size(), 1u);
    EXPECT_EQ(listener_.received[0].title, "Song");
}

TEST_F(BindingRegistryTest, OtherPlayersAreIgnored) {
    service_.appear("vlc");
    EXPECT_FALSE(registry_.isBound());
    EXPECT_EQ(service_.subscribeCalls, 0);

    service_.appear("spotify");
    service_.vanish("vlc");
    EXPECT_TRUE(registry_.isBound());
}

TEST_F(BindingRegistryTest, RepeatedAppearanceKeepsSingleSubscription) {
    service_.appear("spotify");
    service_.appear("spotify");

    EXPECT_EQ(service_.subscribeCalls, 1);
    EXPECT_EQ(service_.activeSubscriptions, 1);
}

TEST_F(BindingRegistryTest, RebindsAfterRestart) {
    service_.appear("spotify");
    ASSERT_TRUE(registry_.isBound());

    service_.vanish("spotify");
    EXPECT_FALSE(registry_.isBound());
    EXPECT_EQ(service_.activeSubscriptions, 0);
    EXPECT_FALSE(service_.emit("A", "Lost"));

    service_.appear("spotify");
    EXPECT_TRUE(registry_.isBound());
    EXPECT_EQ(service_.subscribeCalls, 2);
    EXPECT_EQ(service_.activeSubscriptions, 1);

    ASSERT_TRUE(service_.emit("", "Advertisement"));
    ASSERT_EQ(listener_.received.size(), 1u);
    EXPECT_EQ(listener_.received[0].title, "Advertisement");
}

TEST_F(BindingRegistryTest, VanishIsIdempotent) {
    service_.vanish("spotify");
    service_.vanish("spotify");
    EXPECT_FALSE(registry_.isBound());
}

TEST_F(BindingRegistryTest, FailedSubscribeStaysUnboundAndRetries) {
    service_.failSubscribe = true;
    service_.appear("spotify");
    EXPECT_FALSE(registry_.isBound());

    service_.failSubscribe = false;
    service_.vanish("spotify");
    service_.appear("spotify");
    EXPECT_TRUE(registry_.isBound());
    EXPECT_EQ(service_.subscribeCalls, 2);
}

TEST_F(BindingRegistryTest, BindIfPresentUsesRunningPlayers) {
    service_.running = {"vlc", "spotify"};
    registry_.bindIfPresent();
    EXPECT_TRUE(registry_.isBound());
}

TEST_F(BindingRegistryTest, BindIfPresentWithoutPlayerStaysUnbound) {
    service_.running = {"vlc"};
    registry_.bindIfPresent();
    EXPECT_FALSE(registry_.isBound());
}

TEST_F(BindingRegistryTest, ReleaseDropsSubscription) {
    service_.appear("spotify");
    registry_.release();
    EXPECT_FALSE(registry_.isBound());
    EXPECT_EQ(service_.activeSubscriptions, 0);
}
