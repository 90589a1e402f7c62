#include "daemon/shutdown_manager.h"
#include "support/scoped_env.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using ad_silencer::daemon::ShutdownManager;
using ad_silencer::testing::ScopedEnv;
namespace graceful_shutdown = ad_silencer::graceful_shutdown;

namespace {

// Datagram socket standing in for systemd's NOTIFY_SOCKET (abstract address).
class NotifySocket {
   public:
    NotifySocket() {
        name_ = "ad_silencer_notify_" + std::to_string(getpid());
        fd_ = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::memcpy(addr.sun_path + 1, name_.data(), name_.size());
        socklen_t len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name_.size());
        bound_ = fd_ >= 0 && bind(fd_, reinterpret_cast<sockaddr*>(&addr), len) == 0;
    }
    ~NotifySocket() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    bool bound() const {
        return bound_;
    }
    std::string envValue() const {
        return "@" + name_;
    }

    // Next pending datagram, empty when none is queued
    std::string receive() {
        char buf[512];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) {
            return {};
        }
        return std::string(buf, static_cast<std::size_t>(n));
    }

   private:
    std::string name_;
    int fd_ = -1;
    bool bound_ = false;
};

}  // namespace

class ShutdownManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        graceful_shutdown::getGlobalSignalState().reset();
    }
    void TearDown() override {
        graceful_shutdown::getGlobalSignalState().reset();
    }

    std::atomic<bool> running_{true};
};

TEST_F(ShutdownManagerTest, RequiresRunningFlag) {
    EXPECT_THROW(ShutdownManager(ShutdownManager::Dependencies{}), std::invalid_argument);
}

TEST_F(ShutdownManagerTest, TickWithoutSignalKeepsRunning) {
    ShutdownManager manager({&running_});
    manager.tick();
    EXPECT_TRUE(running_.load());
    EXPECT_TRUE(manager.isRunning());
}

TEST_F(ShutdownManagerTest, SignalStopsLoopAndCancelsWork) {
    ShutdownManager manager({&running_});
    bool cancelled = false;
    manager.setCancelCallback([&cancelled]() { cancelled = true; });

    graceful_shutdown::signalHandler(SIGTERM);
    manager.tick();

    EXPECT_FALSE(running_.load());
    EXPECT_FALSE(manager.isRunning());
    EXPECT_TRUE(cancelled);
}

TEST_F(ShutdownManagerTest, CleanupRunsOnce) {
    ShutdownManager manager({&running_});
    int cleanups = 0;
    manager.setCleanupCallback([&cleanups]() { ++cleanups; });

    manager.runShutdownSequence();
    manager.runShutdownSequence();
    EXPECT_EQ(cleanups, 1);
}

TEST_F(ShutdownManagerTest, FailingCleanupDoesNotEscape) {
    ShutdownManager manager({&running_});
    manager.setCleanupCallback([]() { throw std::runtime_error("mixer gone"); });
    EXPECT_NO_THROW(manager.runShutdownSequence());
}

TEST_F(ShutdownManagerTest, NoWatchdogWithoutUnitSetting) {
    ScopedEnv usec("WATCHDOG_USEC", nullptr);
    ScopedEnv notify("NOTIFY_SOCKET", nullptr);
    ShutdownManager manager({&running_});
    manager.notifyReady("test");
    EXPECT_EQ(manager.watchdogInterval(), std::chrono::microseconds::zero());
}

TEST_F(ShutdownManagerTest, WatchdogIntervalIsHalfTheDeadline) {
    ScopedEnv usec("WATCHDOG_USEC", "2000000");
    ScopedEnv pid("WATCHDOG_PID", nullptr);
    ScopedEnv notify("NOTIFY_SOCKET", nullptr);
    ShutdownManager manager({&running_});
    manager.notifyReady("test");
    EXPECT_EQ(manager.watchdogInterval(), std::chrono::microseconds(1000000));
}

TEST_F(ShutdownManagerTest, TicksSendNothingWhenWatchdogDisabled) {
    NotifySocket socket;
    ASSERT_TRUE(socket.bound());
    const std::string address = socket.envValue();
    ScopedEnv notify("NOTIFY_SOCKET", address.c_str());
    ScopedEnv usec("WATCHDOG_USEC", nullptr);

    ShutdownManager manager({&running_});
    manager.notifyReady("watching");
    EXPECT_NE(socket.receive().find("READY=1"), std::string::npos);

    for (int i = 0; i < 5; ++i) {
        manager.tick();
    }
    EXPECT_EQ(socket.receive(), "");
}

TEST_F(ShutdownManagerTest, WatchdogPingIsPaced) {
    NotifySocket socket;
    ASSERT_TRUE(socket.bound());
    const std::string address = socket.envValue();
    ScopedEnv notify("NOTIFY_SOCKET", address.c_str());
    ScopedEnv usec("WATCHDOG_USEC", "100000");
    ScopedEnv pid("WATCHDOG_PID", nullptr);

    ShutdownManager manager({&running_});
    manager.notifyReady("watching");
    EXPECT_NE(socket.receive().find("READY=1"), std::string::npos);

    // Interval is 50 ms; an immediate tick is too early
    manager.tick();
    EXPECT_EQ(socket.receive(), "");

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    manager.tick();
    EXPECT_EQ(socket.receive(), "WATCHDOG=1");
}
