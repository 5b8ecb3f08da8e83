#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"
#include "yaml-cpp/yaml.h"

namespace proverd::harvest {

struct JobResult {
    nlohmann::json summary = nlohmann::json::object();
    nlohmann::json files = nlohmann::json::object();
};

nlohmann::json ToJson(const JobResult& result);

// Plain scalars follow YAML 1.2 core typing (null, true/false, integers,
// floats); quoted scalars stay strings.
nlohmann::json YamlToJson(const YAML::Node& node);

// "proof.log" -> {"proof", "log"}, "a.tar.gz" -> {"a", "tar.gz"},
// "README" -> {"README", ""}.
std::pair<std::string, std::string> SplitFileName(const std::string& filename);

class ArtifactHarvester {
public:
    ArtifactHarvester(config::ResultConfig config, utils::Logger& logger);

    // Throws JobError (kHarvest) when the summary file is missing, unreadable
    // or not a YAML mapping, and JobError (kResource) when the workspace
    // cannot be listed. Unreadable or empty output files are skipped.
    JobResult Collect(const std::filesystem::path& workspace_dir,
                      const sandbox::ExecResult& exec) const;

private:
    nlohmann::json LoadSummary(const std::filesystem::path& workspace_dir) const;
    void AddFile(JobResult& result, const std::string& filename, std::string content) const;

    config::ResultConfig config_;
    utils::Logger& logger_;
};

}  // namespace proverd::harvest
