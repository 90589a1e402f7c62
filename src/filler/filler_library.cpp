#include "filler/filler_library.h"

#include "logging/logger.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <random>
#include <system_error>
#include <utility>

namespace ad_silencer::filler {

namespace fs = std::filesystem;

FillerLibrary::Picker makeUniformPicker() {
    struct State {
        std::mutex mutex;
        std::mt19937 engine{std::random_device{}()};
    };
    auto state = std::make_shared<State>();
    return [state](std::size_t count) {
        std::lock_guard<std::mutex> lock(state->mutex);
        std::uniform_int_distribution<std::size_t> dist(0, count - 1);
        return dist(state->engine);
    };
}

FillerLibrary::FillerLibrary(fs::path directory, Picker picker)
    : directory_(std::move(directory)),
      picker_(picker ? std::move(picker) : makeUniformPicker()) {}

std::vector<fs::path> FillerLibrary::list() const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        LOG_WARN("[FillerLibrary] Cannot read {}: {}", directory_.string(), ec.message());
        return files;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path& path = it->path();
        const std::string name = path.filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc) || typeEc) {
            continue;
        }
        files.push_back(path);
    }
    if (ec) {
        LOG_WARN("[FillerLibrary] Listing {} stopped early: {}", directory_.string(),
                 ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

core::ErrorCode FillerLibrary::pick(fs::path& out) const {
    auto files = list();
    if (files.empty()) {
        return core::ErrorCode::PLAYBACK_LIBRARY_EMPTY;
    }
    std::size_t index = picker_(files.size());
    if (index >= files.size()) {
        index = files.size() - 1;
    }
    out = files[index];
    return core::ErrorCode::OK;
}

}  // namespace ad_silencer::filler
