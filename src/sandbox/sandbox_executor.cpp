#include "sandbox/sandbox_executor.hpp"

#include <boost/process/v1.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"

namespace proverd::sandbox {
namespace bp = boost::process::v1;
namespace {

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

}  // namespace

WaitOutcome WaitForExit(int pid,
                        std::chrono::steady_clock::time_point deadline,
                        std::chrono::milliseconds poll_interval,
                        int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return WaitOutcome::kExited;
        }
        if (waited < 0 && errno != EINTR) {
            return WaitOutcome::kFailed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitOutcome::kDeadline;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

int TerminateProcessGroup(int leader, int pgid, std::chrono::milliseconds grace) {
    int status = 0;
    ::kill(-pgid, SIGTERM);
    const auto outcome = WaitForExit(leader, std::chrono::steady_clock::now() + grace,
                                     std::chrono::milliseconds(10), status);
    // Descendants may have ignored SIGTERM even when the leader is gone.
    ::kill(-pgid, SIGKILL);
    if (outcome != WaitOutcome::kDeadline) {
        return status;
    }
    while (::waitpid(leader, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return status;
}

ExecResult SandboxExecutor::Run(const std::filesystem::path& binary,
                                const std::vector<std::string>& args,
                                const std::filesystem::path& working_dir,
                                const ExecOptions& options,
                                utils::Logger& logger) {
    ExecResult result{};
    const auto capture_path = std::filesystem::temp_directory_path() /
                              ("proverd_output_" + utils::RandomHex(16) + ".log");

    // start_dir is applied before exec, so a relative binary would resolve
    // against the working directory.
    std::error_code abs_ec;
    auto exe = std::filesystem::absolute(binary, abs_ec);
    if (abs_ec) {
        exe = binary;
    }

    logger.Info("Launching prover", {
        {"binary", exe.string()},
        {"args", utils::Join(args, " ")},
        {"timeout_ms", std::to_string(options.timeout.count())}
    });

    try {
        bp::group group;
        bp::child child_process(
            bp::exe = exe.string(),
            bp::args = args,
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            (bp::std_out & bp::std_err) > capture_path.string(),
            group);

        const pid_t pid = child_process.id();
        const auto deadline = std::chrono::steady_clock::now() + options.timeout;
        int status = 0;
        const auto outcome = WaitForExit(pid, deadline, options.poll_interval, status);
        if (outcome == WaitOutcome::kExited) {
            result.exited_normally = true;
            result.exit_code = DecodeStatus(status);
            // Stragglers the prover left behind would otherwise keep running.
            std::error_code ec;
            group.terminate(ec);
        } else if (outcome == WaitOutcome::kDeadline) {
            result.timed_out = true;
            status = TerminateProcessGroup(pid, pid, options.kill_grace);
            result.exit_code = DecodeStatus(status);
            group.detach();
        } else {
            const auto wait_errno = errno;
            logger.Error("Failed to reap prover", {
                {"pid", std::to_string(pid)},
                {"error", std::strerror(wait_errno)}
            });
            ::kill(-pid, SIGKILL);
            group.detach();
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        result.start_error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadCapture(capture_path);
    std::error_code ec;
    std::filesystem::remove(capture_path, ec);

    if (result.start_error) {
        logger.Error("Prover failed to start", {{"error", *result.start_error}});
    } else if (result.timed_out) {
        logger.Warn("Prover timed out", {{"timeout_ms", std::to_string(options.timeout.count())}});
    } else if (result.exit_code != 0) {
        logger.Warn("Prover exited with error", {{"exit_code", std::to_string(result.exit_code)}});
    } else {
        logger.Info("Prover finished");
    }
    return result;
}

}  // namespace proverd::sandbox
