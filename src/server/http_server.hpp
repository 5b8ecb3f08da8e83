#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "job/job_runner.hpp"
#include "utils/logging.hpp"

namespace proverd::server {

struct HttpReply {
    int status = 200;
    std::string body;
};

// POST / without the transport: parses and validates `body`, runs the job and
// serializes the result. 400 and 500 replies carry no body.
HttpReply HandleProveRequest(const std::string& body,
                             const config::LimitsConfig& limits,
                             const job::JobRunner& runner,
                             utils::Logger& logger);

class HttpServer {
public:
    HttpServer(const config::Config& config, const job::JobRunner& runner, utils::Logger& logger);

    // Binds to the configured host and port, or any free port when the port
    // is 0. Returns the bound port, or -1.
    int Bind();
    // Serves until Stop(). Must follow a successful Bind().
    bool Serve();
    void Stop();

private:
    void RegisterRoutes();

    config::ServerConfig server_config_;
    config::LimitsConfig limits_;
    const job::JobRunner& runner_;
    utils::Logger& logger_;
    httplib::Server http_;
    int bound_port_ = -1;
};

}  // namespace proverd::server
