#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cli/run_once.hpp"
#include "config/config_loader.hpp"
#include "job/job_runner.hpp"
#include "server/http_server.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct CliArgs {
    std::string command = "serve";
    std::filesystem::path config_path;
    std::string formula;
    std::string options = "{}";
    int timeout_s = 10;
    bool trace = false;
};

void PrintUsage() {
    std::cout << "Usage: proverd [serve] [--config <path>]\n"
              << "       proverd run <formula> [--options <json>] [--timeout <s>] [--trace] [--config <path>]"
              << std::endl;
}

std::optional<CliArgs> ParseArgs(int argc, char** argv) {
    CliArgs args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--config") {
            const auto value = next();
            if (!value) {
                return std::nullopt;
            }
            args.config_path = *value;
        } else if (arg == "--options") {
            const auto value = next();
            if (!value) {
                return std::nullopt;
            }
            args.options = *value;
        } else if (arg == "--timeout") {
            const auto value = next();
            if (!value) {
                return std::nullopt;
            }
            char* end = nullptr;
            const long parsed = std::strtol(value->c_str(), &end, 10);
            if (end == value->c_str() || *end != '\0') {
                return std::nullopt;
            }
            args.timeout_s = static_cast<int>(parsed);
        } else if (arg == "--trace") {
            args.trace = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }
    if (!positional.empty()) {
        args.command = positional[0];
    }
    if (args.command == "run") {
        if (positional.size() != 2) {
            return std::nullopt;
        }
        args.formula = positional[1];
    } else if (args.command != "serve" || positional.size() > 1) {
        return std::nullopt;
    }
    return args;
}

std::filesystem::path ResolveConfigPath(const CliArgs& args) {
    if (!args.config_path.empty()) {
        return args.config_path;
    }
    const char* from_env = std::getenv("PROVERD_CONFIG");
    if (from_env && *from_env) {
        return from_env;
    }
    return "proverd.json";
}

int RunServer(const proverd::config::Config& config, proverd::utils::Logger& logger) {
    proverd::job::JobRunner runner(config, logger);
    proverd::server::HttpServer http_server(config, runner, logger);
    if (http_server.Bind() < 0) {
        logger.Error("Failed to bind", {
            {"host", config.server.host},
            {"port", std::to_string(config.server.port)}
        });
        return 1;
    }

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> serve_failed{false};
    std::thread http_thread([&http_server, &serve_failed]() {
        if (!http_server.Serve()) {
            serve_failed.store(true);
        }
    });

    while (g_signal == 0 && !serve_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_signal != 0) {
        logger.Info("Shutting down", {{"signal", std::to_string(static_cast<int>(g_signal))}});
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    if (serve_failed.load()) {
        logger.Error("HTTP server stopped unexpectedly");
        return 1;
    }
    return 0;
}

int RunOnce(const CliArgs& args, const proverd::config::Config& config, proverd::utils::Logger& logger) {
    proverd::cli::RunOnceArgs run;
    run.formula = args.formula;
    run.options = args.options;
    run.timeout_s = args.timeout_s;
    run.trace = args.trace;
    return proverd::cli::RunOnce(run, config, logger, std::cout, std::cerr);
}

}  // namespace

int main(int argc, char** argv) {
    const auto args = ParseArgs(argc, argv);
    if (!args) {
        PrintUsage();
        return 2;
    }

    proverd::config::LoadDotEnv(".env");
    proverd::config::Config config;
    try {
        config = proverd::config::LoadConfig(ResolveConfigPath(*args));
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load config: " << ex.what() << std::endl;
        return 1;
    }

    proverd::utils::StreamLogger logger(std::cerr, config.log);
    if (args->command == "run") {
        return RunOnce(*args, config, logger);
    }
    return RunServer(config, logger);
}
