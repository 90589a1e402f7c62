#include "mixer/pactl_mixer.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace ad_silencer::mixer {

namespace {

constexpr const char* kSinkInputHeader = "Sink Input #";
constexpr const char* kMuteKey = "Mute:";
constexpr const char* kAppNameKey = "application.name";

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

// `key = "value"` -> value
std::string propertyValue(const std::string& line) {
    auto eq = line.find('=');
    if (eq == std::string::npos) {
        return {};
    }
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

std::vector<OutputStream> parseSinkInputs(const std::string& text) {
    std::vector<OutputStream> streams;
    std::istringstream in(text);
    std::string rawLine;
    OutputStream* current = nullptr;

    while (std::getline(in, rawLine)) {
        std::string line = trim(rawLine);
        if (startsWith(line, kSinkInputHeader)) {
            std::string number = line.substr(std::char_traits<char>::length(kSinkInputHeader));
            char* end = nullptr;
            unsigned long index = std::strtoul(number.c_str(), &end, 10);
            if (end == number.c_str()) {
                current = nullptr;
                continue;
            }
            streams.push_back(OutputStream{static_cast<uint32_t>(index), {}, false});
            current = &streams.back();
            continue;
        }
        if (!current) {
            continue;
        }
        if (startsWith(line, kMuteKey)) {
            current->muted = trim(line.substr(std::char_traits<char>::length(kMuteKey))) == "yes";
        } else if (startsWith(line, kAppNameKey)) {
            current->applicationName = propertyValue(line);
        }
    }
    return streams;
}

PactlMixer::PactlMixer(std::string pactlPath, Runner runner)
    : pactlPath_(std::move(pactlPath)), runner_(std::move(runner)) {}

core::ProcessResult PactlMixer::run(const std::vector<std::string>& args) {
    std::vector<std::string> command;
    command.reserve(args.size() + 1);
    command.push_back(pactlPath_);
    command.insert(command.end(), args.begin(), args.end());
    return runner_(command, {"LC_ALL=C"});
}

core::ErrorCode PactlMixer::listStreams(std::vector<OutputStream>& out) {
    auto result = run({"list", "sink-inputs"});
    if (!result.ok()) {
        LOG_DEBUG("[PactlMixer] 'pactl list sink-inputs' failed (spawned={}, exit={})",
                  result.spawned, result.exitCode);
        return core::ErrorCode::MIXER_COMMAND_FAILED;
    }
    out = parseSinkInputs(result.output);
    return core::ErrorCode::OK;
}

core::ErrorCode PactlMixer::resolveStreams(const std::string& applicationName,
                                           std::vector<uint32_t>& out) {
    out.clear();
    std::vector<OutputStream> streams;
    auto rc = listStreams(streams);
    if (rc != core::ErrorCode::OK) {
        return rc;
    }

    // pipewire-pulse reports "spotify" where PulseAudio reported "Spotify"
    const std::string wanted = toLower(applicationName);
    for (const auto& stream : streams) {
        if (toLower(stream.applicationName) == wanted) {
            out.push_back(stream.index);
        }
    }
    return out.empty() ? core::ErrorCode::MIXER_STREAM_NOT_FOUND : core::ErrorCode::OK;
}

core::ErrorCode PactlMixer::setMute(uint32_t streamIndex, bool muted) {
    auto result = run({"set-sink-input-mute", std::to_string(streamIndex), muted ? "1" : "0"});
    if (!result.ok()) {
        LOG_DEBUG("[PactlMixer] set-sink-input-mute {} {} failed (exit={})", streamIndex,
                  muted ? 1 : 0, result.exitCode);
        return core::ErrorCode::MIXER_COMMAND_FAILED;
    }
    return core::ErrorCode::OK;
}

}  // namespace ad_silencer::mixer
