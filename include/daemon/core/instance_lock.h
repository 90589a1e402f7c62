#pragma once

#include <optional>
#include <string>

namespace ad_silencer::daemon {

// Single-instance guard bound to the abstract UNIX socket address
// "\0<name>". The kernel frees the address when the process exits, so a
// crashed instance never leaves a stale lock behind.
class InstanceLock {
   public:
    // std::nullopt when the name is taken (alreadyRunning=true) or the socket
    // cannot be created (alreadyRunning=false).
    static std::optional<InstanceLock> tryAcquire(const std::string& name, bool& alreadyRunning);

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;

    ~InstanceLock();

    const std::string& name() const;

   private:
    InstanceLock(std::string name, int fd);

    void release() noexcept;

    std::string name_;
    int fd_ = -1;
};

}  // namespace ad_silencer::daemon
