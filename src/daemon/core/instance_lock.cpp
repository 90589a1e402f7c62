#include "daemon/core/instance_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace ad_silencer::daemon {

std::optional<InstanceLock> InstanceLock::tryAcquire(const std::string& name,
                                                     bool& alreadyRunning) {
    alreadyRunning = false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    // Leading NUL selects the abstract namespace.
    if (name.empty() || name.size() + 1 > sizeof(addr.sun_path)) {
        LOG_ERROR("Invalid instance lock name: '{}'", name);
        return std::nullopt;
    }
    std::memcpy(addr.sun_path + 1, name.data(), name.size());
    const auto addrLen = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("Cannot create instance lock socket: {}", strerror(errno));
        return std::nullopt;
    }

    if (bind(fd, reinterpret_cast<const sockaddr*>(&addr), addrLen) < 0) {
        const int err = errno;
        close(fd);
        if (err == EADDRINUSE) {
            alreadyRunning = true;
            LOG_INFO("Another instance is already running (lock '{}')", name);
        } else {
            LOG_ERROR("Cannot bind instance lock '{}': {}", name, strerror(err));
        }
        return std::nullopt;
    }

    LOG_DEBUG("Instance lock '{}' acquired", name);
    return InstanceLock(name, fd);
}

InstanceLock::InstanceLock(std::string name, int fd) : name_(std::move(name)), fd_(fd) {}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : name_(std::move(other.name_)), fd_(other.fd_) {
    other.fd_ = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    name_ = std::move(other.name_);
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

InstanceLock::~InstanceLock() {
    release();
}

const std::string& InstanceLock::name() const {
    return name_;
}

void InstanceLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    close(fd_);
    fd_ = -1;
}

}  // namespace ad_silencer::daemon
