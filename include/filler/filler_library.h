#pragma once

#include "core/error_codes.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace ad_silencer::filler {

// Directory of filler clips. Only regular, non-hidden files are candidates;
// the directory is re-read on every pick so clips can be added at runtime.
class FillerLibrary {
   public:
    // Returns an index in [0, count). count is never 0.
    using Picker = std::function<std::size_t(std::size_t count)>;

    explicit FillerLibrary(std::filesystem::path directory, Picker picker = {});

    const std::filesystem::path& directory() const {
        return directory_;
    }

    // Sorted candidate list. Empty when the directory is missing or unreadable.
    std::vector<std::filesystem::path> list() const;

    // PLAYBACK_LIBRARY_EMPTY when there is nothing to pick.
    core::ErrorCode pick(std::filesystem::path& out) const;

   private:
    std::filesystem::path directory_;
    Picker picker_;
};

// Uniform picker backed by a std::mt19937 seeded from std::random_device.
FillerLibrary::Picker makeUniformPicker();

}  // namespace ad_silencer::filler
