#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace ad_silencer::testing {

// Sets (or unsets) an environment variable for the lifetime of the scope.
class ScopedEnv {
   public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = std::string(old);
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (previous_) {
            setenv(name_, previous_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

   private:
    const char* name_;
    std::optional<std::string> previous_;
};

}  // namespace ad_silencer::testing
