#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace proverd::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool ParseGrouping(const std::string& value, FileGrouping& grouping) {
    if (value == "flat") {
        grouping = FileGrouping::kFlat;
        return true;
    }
    if (value == "extension" || value == "by_extension") {
        grouping = FileGrouping::kByExtension;
        return true;
    }
    return false;
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

}  // namespace

void LoadDotEnv(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return;
    }
    std::string line;
    while (std::getline(input, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = Trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = Trim(line.substr(0, eq));
        auto value = Trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) {
            continue;
        }
        ::setenv(key.c_str(), value.c_str(), 0);
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "workerThreads", config.server.worker_threads);
        if (server.contains("maxBodyBytes") && server["maxBodyBytes"].is_number_unsigned()) {
            config.server.max_body_bytes = server["maxBodyBytes"].get<std::size_t>();
        }
    }

    if (data.contains("prover") && data["prover"].is_object()) {
        const auto& prover = data["prover"];
        ReadString(prover, "binDir", config.prover.bin_dir);
        ReadString(prover, "name", config.prover.name);
        ReadString(prover, "traceSuffix", config.prover.trace_suffix);
        ReadString(prover, "windowsSuffix", config.prover.windows_suffix);
        ReadString(prover, "outputFlag", config.prover.output_flag);
        ReadInt(prover, "killGraceMs", config.prover.kill_grace_ms);
    }

    if (data.contains("workspace") && data["workspace"].is_object()) {
        const auto& workspace = data["workspace"];
        ReadString(workspace, "root", config.workspace.root);
        ReadString(workspace, "prefix", config.workspace.prefix);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ReadInt(limits, "minTimeoutS", config.limits.min_timeout_s);
        ReadInt(limits, "maxTimeoutS", config.limits.max_timeout_s);
    }

    if (data.contains("result") && data["result"].is_object()) {
        const auto& result = data["result"];
        if (result.contains("grouping") && result["grouping"].is_string()) {
            ParseGrouping(result["grouping"].get<std::string>(), config.result.grouping);
        }
        ReadBool(result, "alwaysIncludeOutput", config.result.always_include_output);
        ReadBool(result, "alwaysIncludeTimeout", config.result.always_include_timeout);
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            utils::ParseLogLevel(log["level"].get<std::string>(), config.log.min_level);
        }
        if (log.contains("format") && log["format"].is_string()) {
            utils::ParseLogFormat(log["format"].get<std::string>(), config.log.format);
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    if (GetEnv("ENV") == "dev") {
        config.server.host = "localhost";
    }

    const auto host = GetEnv("PROVERD_SERVER__HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    auto port = GetEnv("PROVERD_SERVER__PORT");
    if (port.empty()) {
        port = GetEnv("PORT");
    }
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto worker_threads = GetEnv("PROVERD_SERVER__WORKER_THREADS");
    if (!worker_threads.empty()) {
        config.server.worker_threads = ParseInt(worker_threads, config.server.worker_threads);
    }

    const auto bin_dir = GetEnv("PROVERD_PROVER__BIN_DIR");
    if (!bin_dir.empty()) {
        config.prover.bin_dir = bin_dir;
    }

    const auto name = GetEnv("PROVERD_PROVER__NAME");
    if (!name.empty()) {
        config.prover.name = name;
    }

    const auto kill_grace = GetEnv("PROVERD_PROVER__KILL_GRACE_MS");
    if (!kill_grace.empty()) {
        config.prover.kill_grace_ms = ParseInt(kill_grace, config.prover.kill_grace_ms);
    }

    const auto workspace_root = GetEnv("PROVERD_WORKSPACE__ROOT");
    if (!workspace_root.empty()) {
        config.workspace.root = workspace_root;
    }

    const auto min_timeout = GetEnv("PROVERD_LIMITS__MIN_TIMEOUT_S");
    if (!min_timeout.empty()) {
        config.limits.min_timeout_s = ParseInt(min_timeout, config.limits.min_timeout_s);
    }

    const auto max_timeout = GetEnv("PROVERD_LIMITS__MAX_TIMEOUT_S");
    if (!max_timeout.empty()) {
        config.limits.max_timeout_s = ParseInt(max_timeout, config.limits.max_timeout_s);
    }

    const auto grouping = GetEnv("PROVERD_RESULT__GROUPING");
    if (!grouping.empty()) {
        ParseGrouping(grouping, config.result.grouping);
    }

    const auto always_output = GetEnv("PROVERD_RESULT__ALWAYS_INCLUDE_OUTPUT");
    if (!always_output.empty()) {
        config.result.always_include_output = ParseBool(always_output);
    }

    const auto always_timeout = GetEnv("PROVERD_RESULT__ALWAYS_INCLUDE_TIMEOUT");
    if (!always_timeout.empty()) {
        config.result.always_include_timeout = ParseBool(always_timeout);
    }

    const auto log_level = GetEnv("PROVERD_LOG__LEVEL");
    if (!log_level.empty()) {
        utils::ParseLogLevel(log_level, config.log.min_level);
    }

    const auto log_format = GetEnv("PROVERD_LOG__FORMAT");
    if (!log_format.empty()) {
        utils::ParseLogFormat(log_format, config.log.format);
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            throw std::runtime_error("cannot open config file " + config_path.string());
        }
        nlohmann::json data;
        try {
            input >> data;
        } catch (const nlohmann::json::parse_error& ex) {
            throw std::runtime_error("invalid config file " + config_path.string() + ": " + ex.what());
        }
        ApplyConfigFromJson(config, data);
    }

    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace proverd::config
