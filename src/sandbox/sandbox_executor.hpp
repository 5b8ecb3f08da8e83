#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace proverd::sandbox {

struct ExecResult {
    // The process ended on its own before the deadline, whatever its exit
    // code or terminating signal.
    bool exited_normally = false;
    bool timed_out = false;
    int exit_code = -1;
    // Combined stdout and stderr, including whatever was written before a
    // timeout kill.
    std::string output;
    // Set only when the binary could not be launched at all.
    std::optional<std::string> start_error;
};

struct ExecOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds kill_grace{200};
    std::chrono::milliseconds poll_interval{20};
};

class SandboxExecutor {
public:
    static ExecResult Run(const std::filesystem::path& binary,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& working_dir,
                          const ExecOptions& options,
                          utils::Logger& logger);
};

enum class WaitOutcome {
    kExited,
    kDeadline,
    kFailed,
};

// Polls `pid` with WNOHANG until it is reaped, `deadline` passes, or waitpid
// fails (for example ECHILD). `status` is valid only for kExited.
WaitOutcome WaitForExit(int pid,
                        std::chrono::steady_clock::time_point deadline,
                        std::chrono::milliseconds poll_interval,
                        int& status);

// Sends SIGTERM to every process in `pgid`, waits up to `grace` for `leader`
// to exit, then SIGKILLs the group and reaps `leader`. Returns the wait
// status of `leader`.
int TerminateProcessGroup(int leader, int pgid, std::chrono::milliseconds grace);

}  // namespace proverd::sandbox
