#include "harvest/artifact_harvester.hpp"

#include <fstream>
#include <sstream>

#include "job/job_error.hpp"
#include "job/job_types.hpp"

namespace proverd::harvest {
namespace {

bool IsNullScalar(const std::string& value) {
    return value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL";
}

// YAML 1.2 core schema: yes/no/on/off stay plain strings.
bool ParseBoolScalar(const std::string& value, bool& out) {
    if (value == "true" || value == "True" || value == "TRUE") {
        out = true;
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

nlohmann::json ScalarToJson(const YAML::Node& node) {
    const auto& value = node.Scalar();
    const auto& tag = node.Tag();
    if (tag == "!" || tag == "tag:yaml.org,2002:str") {
        return value;
    }
    if (IsNullScalar(value)) {
        return nullptr;
    }
    bool flag = false;
    if (ParseBoolScalar(value, flag)) {
        return flag;
    }
    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    unsigned long long unsigned_integer = 0;
    if (YAML::convert<unsigned long long>::decode(node, unsigned_integer)) {
        return unsigned_integer;
    }
    double number = 0;
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    return value;
}

[[noreturn]] void ThrowHarvest(const std::string& message) {
    throw job::JobError(job::JobErrorKind::kHarvest, message);
}

}  // namespace

nlohmann::json ToJson(const JobResult& result) {
    return {
        {"summary", result.summary},
        {"files", result.files}
    };
}

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& item : node) {
                const auto key = item.first.IsScalar() ? item.first.Scalar() : YAML::Dump(item.first);
                object[key] = YamlToJson(item.second);
            }
            return object;
        }
    }
    return nullptr;
}

std::pair<std::string, std::string> SplitFileName(const std::string& filename) {
    const auto dot = filename.find('.');
    if (dot == std::string::npos) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot + 1)};
}

ArtifactHarvester::ArtifactHarvester(config::ResultConfig config, utils::Logger& logger)
    : config_(config)
    , logger_(logger) {}

JobResult ArtifactHarvester::Collect(const std::filesystem::path& workspace_dir,
                                     const sandbox::ExecResult& exec) const {
    JobResult result;
    result.summary = LoadSummary(workspace_dir);

    if (!exec.output.empty() || config_.always_include_output) {
        result.summary["stdout"] = exec.output;
    }
    if (exec.timed_out || config_.always_include_timeout) {
        result.summary["timed_out"] = exec.timed_out;
    }

    std::error_code ec;
    for (std::filesystem::directory_iterator it(workspace_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto filename = it->path().filename().string();
        if (filename == job::kFormulaFile || filename == job::kOptionsFile || filename == job::kSummaryFile) {
            continue;
        }

        std::error_code type_ec;
        const auto status = it->status(type_ec);
        if (type_ec || status.type() == std::filesystem::file_type::not_found) {
            logger_.Error("Failed to read output file", {
                {"file", filename},
                {"error", type_ec ? type_ec.message() : "not found"}
            });
            continue;
        }
        if (!std::filesystem::is_regular_file(status)) {
            logger_.Debug("Skipping non-regular output entry", {{"file", filename}});
            continue;
        }

        std::ifstream input(it->path(), std::ios::binary);
        std::ostringstream buffer;
        if (input.is_open()) {
            buffer << input.rdbuf();
        }
        if (!input.is_open() || input.bad()) {
            logger_.Error("Failed to read output file", {{"file", filename}});
            continue;
        }

        auto content = buffer.str();
        if (content.empty()) {
            continue;
        }
        AddFile(result, filename, std::move(content));
    }
    if (ec) {
        throw job::JobError(job::JobErrorKind::kResource,
                            "cannot list workspace " + workspace_dir.string() + ": " + ec.message());
    }
    return result;
}

nlohmann::json ArtifactHarvester::LoadSummary(const std::filesystem::path& workspace_dir) const {
    const auto path = workspace_dir / job::kSummaryFile;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        ThrowHarvest(std::string("cannot open ") + job::kSummaryFile);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        ThrowHarvest(std::string("cannot read ") + job::kSummaryFile);
    }

    YAML::Node document;
    try {
        document = YAML::Load(buffer.str());
    } catch (const YAML::Exception& ex) {
        ThrowHarvest(std::string("cannot parse ") + job::kSummaryFile + ": " + ex.what());
    }
    if (!document.IsMap()) {
        ThrowHarvest(std::string(job::kSummaryFile) + " is not a mapping");
    }
    return YamlToJson(document);
}

void ArtifactHarvester::AddFile(JobResult& result, const std::string& filename, std::string content) const {
    if (config_.grouping == config::FileGrouping::kFlat) {
        result.files[filename] = std::move(content);
        return;
    }
    const auto [base, extension] = SplitFileName(filename);
    result.files[extension][base] = std::move(content);
}

}  // namespace proverd::harvest
