#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace proverd::job {

// File names shared with the prover binary.
inline constexpr const char* kFormulaFile = "formula.txt";
inline constexpr const char* kOptionsFile = "options.json";
inline constexpr const char* kSummaryFile = "result.yaml";

struct JobRequest {
    std::string formula;
    nlohmann::json options = nlohmann::json::object();
    int timeout_s = 0;
    bool trace = false;
};

// Checks field presence, types and the timeout range. Throws JobError with
// kInvalidRequest on the first violation.
JobRequest ParseJobRequest(const nlohmann::json& body, const config::LimitsConfig& limits);

nlohmann::json ToJson(const JobRequest& request);

}  // namespace proverd::job
