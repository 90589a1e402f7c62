#pragma once

#include <string>
#include <vector>

namespace ad_silencer::core {

struct ProcessResult {
    bool spawned = false;
    int exitCode = -1;   // -1 when the child did not exit normally
    std::string output;  // captured stdout

    bool ok() const {
        return spawned && exitCode == 0;
    }
};

// Runs args[0] (looked up in PATH) to completion and captures its stdout.
// stderr is discarded. extraEnv entries ("KEY=value") override the inherited
// environment, e.g. LC_ALL=C to keep tool output parseable.
ProcessResult runProcess(const std::vector<std::string>& args,
                         const std::vector<std::string>& extraEnv = {});

}  // namespace ad_silencer::core
