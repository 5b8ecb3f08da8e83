#pragma once

#include <cstddef>
#include <string>

#include "utils/logging.hpp"

namespace proverd::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    int worker_threads = 8;
    std::size_t max_body_bytes = 1024 * 1024;
};

struct ProverConfig {
    std::string bin_dir = "./bin";
    std::string name = "prover";
    std::string trace_suffix = "-trace";
    std::string windows_suffix = "-windows.exe";
    std::string output_flag = "--out";
    int kill_grace_ms = 200;
};

struct WorkspaceConfig {
    std::string root = ".";
    std::string prefix = "tmp-";
};

struct LimitsConfig {
    int min_timeout_s = 1;
    int max_timeout_s = 10;
};

enum class FileGrouping {
    kFlat,
    kByExtension
};

struct ResultConfig {
    FileGrouping grouping = FileGrouping::kByExtension;
    bool always_include_output = false;
    bool always_include_timeout = false;
};

struct Config {
    ServerConfig server;
    ProverConfig prover;
    WorkspaceConfig workspace;
    LimitsConfig limits;
    ResultConfig result;
    utils::LogConfig log;
};

}  // namespace proverd::config
