#include "server/http_server.hpp"

#include <chrono>
#include <exception>

#include "job/job_error.hpp"
#include "nlohmann/json.hpp"

namespace proverd::server {
namespace {

std::string DumpJson(const nlohmann::json& json) {
    // Prover output is not guaranteed to be UTF-8.
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

httplib::Headers SecurityHeaders() {
    return {
        {"X-Content-Type-Options", "nosniff"},
        {"X-Frame-Options", "SAMEORIGIN"},
        {"X-XSS-Protection", "0"},
        {"Referrer-Policy", "no-referrer"},
        {"Cross-Origin-Opener-Policy", "same-origin"},
        {"Cross-Origin-Resource-Policy", "same-origin"},
        {"X-DNS-Prefetch-Control", "off"},
        {"X-Permitted-Cross-Domain-Policies", "none"}
    };
}

}  // namespace

HttpReply HandleProveRequest(const std::string& body,
                             const config::LimitsConfig& limits,
                             const job::JobRunner& runner,
                             utils::Logger& logger) {
    logger.Info("Request received");

    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        logger.Error("Request body is not valid JSON");
        return {400, ""};
    }

    job::JobRequest request;
    try {
        request = job::ParseJobRequest(json, limits);
    } catch (const job::JobError& ex) {
        logger.Error("Request rejected", {{"error", ex.what()}});
        return {400, ""};
    }
    logger.Info("Request parsed", {{"request", DumpJson(job::ToJson(request))}});

    try {
        const auto started = std::chrono::steady_clock::now();
        const auto result = runner.Run(request);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger.Info("Job done", {{"elapsed_ms", std::to_string(elapsed.count())}});
        return {200, DumpJson(harvest::ToJson(result))};
    } catch (const job::JobError& ex) {
        logger.Error("Job failed", {{"kind", job::ToString(ex.Kind())}, {"error", ex.what()}});
        return {ex.IsClientError() ? 400 : 500, ""};
    }
}

HttpServer::HttpServer(const config::Config& config, const job::JobRunner& runner, utils::Logger& logger)
    : server_config_(config.server)
    , limits_(config.limits)
    , runner_(runner)
    , logger_(logger) {
    RegisterRoutes();
}

void HttpServer::RegisterRoutes() {
    const auto threads = static_cast<std::size_t>(server_config_.worker_threads > 0 ? server_config_.worker_threads : 1);
    http_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    http_.set_payload_max_length(server_config_.max_body_bytes);
    http_.set_default_headers(SecurityHeaders());

    http_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        logger_.Info("HTTP", {
            {"method", req.method},
            {"path", req.path},
            {"status", std::to_string(res.status)},
            {"remote", req.remote_addr}
        });
    });

    http_.set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            message = ex.what();
        } catch (...) {
            // Non-standard exception types carry no message; the log line below
            // still records the failure.
        }
        logger_.Error("Unhandled exception", {{"path", req.path}, {"error", message}});
        res.status = 500;
        res.body.clear();
    });

    http_.Post("/", [this](const httplib::Request& req, httplib::Response& res) {
        const auto reply = HandleProveRequest(req.body, limits_, runner_, logger_);
        res.status = reply.status;
        if (!reply.body.empty()) {
            res.set_content(reply.body, "application/json");
        }
    });

    const auto healthy = [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    };
    http_.Get("/livez", healthy);
    http_.Get("/readyz", healthy);
}

int HttpServer::Bind() {
    if (server_config_.port == 0) {
        bound_port_ = http_.bind_to_any_port(server_config_.host);
    } else if (http_.bind_to_port(server_config_.host, server_config_.port)) {
        bound_port_ = server_config_.port;
    } else {
        bound_port_ = -1;
    }
    return bound_port_;
}

bool HttpServer::Serve() {
    logger_.Info("Starting server", {
        {"host", server_config_.host},
        {"port", std::to_string(bound_port_)}
    });
    return http_.listen_after_bind();
}

void HttpServer::Stop() {
    http_.stop();
}

}  // namespace proverd::server
