#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "harvest/artifact_harvester.hpp"
#include "job/job_types.hpp"
#include "utils/logging.hpp"
#include "workspace/workspace.hpp"

namespace proverd::job {

// `<bin_dir>/<name>[<trace_suffix>][<windows_suffix>]`.
std::filesystem::path ResolveProverBinary(const config::ProverConfig& prover, bool trace);

class JobRunner {
public:
    JobRunner(const config::Config& config, utils::Logger& logger);

    // Runs one request end to end. The workspace is removed before this
    // returns or throws. Fatal steps throw JobError; a timeout is reported
    // inside the result.
    harvest::JobResult Run(const JobRequest& request) const;

private:
    config::ProverConfig prover_;
    workspace::WorkspaceManager workspaces_;
    harvest::ArtifactHarvester harvester_;
    utils::Logger& logger_;
};

}  // namespace proverd::job
