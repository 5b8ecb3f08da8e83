#include "cli/run_once.hpp"

#include <exception>

#include "harvest/artifact_harvester.hpp"
#include "job/job_error.hpp"
#include "job/job_runner.hpp"
#include "job/job_types.hpp"
#include "nlohmann/json.hpp"

namespace proverd::cli {

int RunOnce(const RunOnceArgs& args,
            const config::Config& config,
            utils::Logger& logger,
            std::ostream& out,
            std::ostream& err) {
    const auto options = nlohmann::json::parse(args.options, nullptr, false);
    if (options.is_discarded()) {
        err << "--options is not valid JSON" << std::endl;
        return 2;
    }
    const nlohmann::json body = {
        {"formula", args.formula},
        {"options", options},
        {"timeout", args.timeout_s},
        {"trace", args.trace}
    };

    try {
        const auto request = job::ParseJobRequest(body, config.limits);
        const job::JobRunner runner(config, logger);
        const auto result = runner.Run(request);
        out << harvest::ToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
        return 0;
    } catch (const job::JobError& ex) {
        err << "Error (" << job::ToString(ex.Kind()) << "): " << ex.what() << std::endl;
        return ex.IsClientError() ? 2 : 1;
    } catch (const std::exception& ex) {
        logger.Error("Job failed", {{"error", ex.what()}});
        err << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

}  // namespace proverd::cli
