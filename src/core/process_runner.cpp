#include "core/process_runner.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ad_silencer::core {

namespace {

std::string envKey(const std::string& entry) {
    auto pos = entry.find('=');
    return pos == std::string::npos ? entry : entry.substr(0, pos);
}

std::vector<std::string> buildEnvironment(const std::vector<std::string>& extraEnv) {
    std::vector<std::string> env;
    for (char** it = environ; it && *it; ++it) {
        std::string entry(*it);
        bool overridden = false;
        for (const auto& extra : extraEnv) {
            if (envKey(extra) == envKey(entry)) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    env.insert(env.end(), extraEnv.begin(), extraEnv.end());
    return env;
}

std::vector<char*> toArgv(std::vector<std::string>& values) {
    std::vector<char*> argv;
    argv.reserve(values.size() + 1);
    for (auto& value : values) {
        argv.push_back(value.data());
    }
    argv.push_back(nullptr);
    return argv;
}

}  // namespace

ProcessResult runProcess(const std::vector<std::string>& args,
                         const std::vector<std::string>& extraEnv) {
    ProcessResult result;
    if (args.empty()) {
        return result;
    }

    int pipeFds[2] = {-1, -1};
    if (pipe2(pipeFds, O_CLOEXEC) < 0) {
        LOG_ERROR("[process] pipe failed: {}", std::strerror(errno));
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipeFds[1], STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<std::string> argStorage(args);
    std::vector<std::string> envStorage = buildEnvironment(extraEnv);
    std::vector<char*> argv = toArgv(argStorage);
    std::vector<char*> envp = toArgv(envStorage);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    close(pipeFds[1]);

    if (rc != 0) {
        LOG_DEBUG("[process] failed to spawn {}: {}", args[0], std::strerror(rc));
        close(pipeFds[0]);
        return result;
    }
    result.spawned = true;

    char buffer[4096];
    while (true) {
        ssize_t n = read(pipeFds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(pipeFds[0]);

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

}  // namespace ad_silencer::core
