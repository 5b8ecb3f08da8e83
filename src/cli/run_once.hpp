#pragma once

#include <ostream>
#include <string>

#include "config/config_schema.hpp"
#include "utils/logging.hpp"

namespace proverd::cli {

struct RunOnceArgs {
    std::string formula;
    std::string options = "{}";
    int timeout_s = 10;
    bool trace = false;
};

// Runs a single job and prints the result JSON to `out`. Returns 0 on
// success, 2 for a rejected request and 1 for any other failure.
int RunOnce(const RunOnceArgs& args,
            const config::Config& config,
            utils::Logger& logger,
            std::ostream& out,
            std::ostream& err);

}  // namespace proverd::cli
