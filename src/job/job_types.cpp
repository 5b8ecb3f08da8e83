#include "job/job_types.hpp"

#include "job/job_error.hpp"

namespace proverd::job {
namespace {

[[noreturn]] void Reject(const std::string& message) {
    throw JobError(JobErrorKind::kInvalidRequest, message);
}

}  // namespace

JobRequest ParseJobRequest(const nlohmann::json& body, const config::LimitsConfig& limits) {
    if (!body.is_object()) {
        Reject("request body must be an object");
    }

    JobRequest request;

    if (!body.contains("formula") || !body["formula"].is_string()) {
        Reject("formula is required and must be a string");
    }
    request.formula = body["formula"].get<std::string>();
    if (request.formula.empty()) {
        Reject("formula must not be empty");
    }

    if (!body.contains("options") || !body["options"].is_object()) {
        Reject("options is required and must be an object");
    }
    request.options = body["options"];

    const char* timeout_key = body.contains("timeout") ? "timeout" : "timeout_seconds";
    if (!body.contains(timeout_key) || !body[timeout_key].is_number_integer()) {
        Reject("timeout is required and must be an integer");
    }
    const auto timeout = body[timeout_key].get<long long>();
    if (timeout < limits.min_timeout_s || timeout > limits.max_timeout_s) {
        Reject("timeout must be between " + std::to_string(limits.min_timeout_s) +
               " and " + std::to_string(limits.max_timeout_s));
    }
    request.timeout_s = static_cast<int>(timeout);

    if (body.contains("trace") && !body["trace"].is_null()) {
        if (!body["trace"].is_boolean()) {
            Reject("trace must be a boolean");
        }
        request.trace = body["trace"].get<bool>();
    }

    return request;
}

nlohmann::json ToJson(const JobRequest& request) {
    return {
        {"formula", request.formula},
        {"options", request.options},
        {"timeout", request.timeout_s},
        {"trace", request.trace}
    };
}

}  // namespace proverd::job
