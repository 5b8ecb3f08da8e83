#include "job/job_runner.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "job/job_error.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace proverd::job {

std::filesystem::path ResolveProverBinary(const config::ProverConfig& prover, bool trace) {
    std::string name = prover.name;
    if (trace) {
        name += prover.trace_suffix;
    }
#if defined(_WIN32)
    name += prover.windows_suffix;
#endif
    return std::filesystem::path(prover.bin_dir) / name;
}

JobRunner::JobRunner(const config::Config& config, utils::Logger& logger)
    : prover_(config.prover)
    , workspaces_(config.workspace, logger)
    , harvester_(config.result, logger)
    , logger_(logger) {}

harvest::JobResult JobRunner::Run(const JobRequest& request) const {
    const auto workspace = workspaces_.Create();

    workspaces_.WriteInput(*workspace, kFormulaFile, request.formula);
    workspaces_.WriteInput(*workspace, kOptionsFile, request.options.dump(2));

    std::vector<std::string> args;
    if (!prover_.output_flag.empty()) {
        args.push_back(prover_.output_flag);
    }
    args.push_back(workspace->Path().string());

    sandbox::ExecOptions options;
    options.timeout = std::chrono::seconds(request.timeout_s);
    options.kill_grace = std::chrono::milliseconds(prover_.kill_grace_ms);

    const auto exec = sandbox::SandboxExecutor::Run(
        ResolveProverBinary(prover_, request.trace),
        args,
        workspace->Path(),
        options,
        logger_);
    if (exec.start_error) {
        throw JobError(JobErrorKind::kLaunch, *exec.start_error);
    }

    auto result = harvester_.Collect(workspace->Path(), exec);
    workspace->Destroy();
    return result;
}

}  // namespace proverd::job
