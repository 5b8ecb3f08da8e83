#include <gtest/gtest.h>

#include "job/job_error.hpp"
#include "job/job_types.hpp"

using proverd::config::LimitsConfig;
using proverd::job::JobError;
using proverd::job::JobErrorKind;
using proverd::job::ParseJobRequest;

namespace {

nlohmann::json ValidBody() {
    return {
        {"formula", "P -> P"},
        {"options", nlohmann::json::object()},
        {"timeout", 2}
    };
}

void ExpectRejected(const nlohmann::json& body) {
    try {
        ParseJobRequest(body, LimitsConfig{});
        ADD_FAILURE() << "accepted " << body.dump();
    } catch (const JobError& ex) {
        EXPECT_EQ(ex.Kind(), JobErrorKind::kInvalidRequest);
        EXPECT_TRUE(ex.IsClientError());
    }
}

}  // namespace

TEST(JobRequest, ParsesValidBody) {
    auto body = ValidBody();
    body["options"] = {{"a", 1}, {"b", "x"}};
    body["trace"] = true;

    const auto request = ParseJobRequest(body, LimitsConfig{});

    EXPECT_EQ(request.formula, "P -> P");
    EXPECT_EQ(request.options, nlohmann::json({{"a", 1}, {"b", "x"}}));
    EXPECT_EQ(request.timeout_s, 2);
    EXPECT_TRUE(request.trace);
}

TEST(JobRequest, TraceDefaultsToFalse) {
    const auto request = ParseJobRequest(ValidBody(), LimitsConfig{});
    EXPECT_FALSE(request.trace);
}

TEST(JobRequest, AcceptsTimeoutSecondsAlias) {
    auto body = ValidBody();
    body.erase("timeout");
    body["timeout_seconds"] = 7;

    EXPECT_EQ(ParseJobRequest(body, LimitsConfig{}).timeout_s, 7);
}

TEST(JobRequest, RejectsMissingOrEmptyFormula) {
    auto missing = ValidBody();
    missing.erase("formula");
    ExpectRejected(missing);

    auto empty = ValidBody();
    empty["formula"] = "";
    ExpectRejected(empty);

    auto number = ValidBody();
    number["formula"] = 42;
    ExpectRejected(number);
}

TEST(JobRequest, RejectsMissingOrNonObjectOptions) {
    auto missing = ValidBody();
    missing.erase("options");
    ExpectRejected(missing);

    auto null_options = ValidBody();
    null_options["options"] = nullptr;
    ExpectRejected(null_options);

    auto array = ValidBody();
    array["options"] = nlohmann::json::array();
    ExpectRejected(array);
}

TEST(JobRequest, EnforcesTimeoutRange) {
    for (const int timeout : {0, -1, 11, 1000}) {
        auto body = ValidBody();
        body["timeout"] = timeout;
        ExpectRejected(body);
    }
    for (const int timeout : {1, 10}) {
        auto body = ValidBody();
        body["timeout"] = timeout;
        EXPECT_EQ(ParseJobRequest(body, LimitsConfig{}).timeout_s, timeout);
    }
}

TEST(JobRequest, RejectsNonIntegerTimeout) {
    auto missing = ValidBody();
    missing.erase("timeout");
    ExpectRejected(missing);

    auto fractional = ValidBody();
    fractional["timeout"] = 2.5;
    ExpectRejected(fractional);

    auto text = ValidBody();
    text["timeout"] = "2";
    ExpectRejected(text);
}

TEST(JobRequest, HonoursConfiguredLimits) {
    LimitsConfig limits;
    limits.max_timeout_s = 30;
    auto body = ValidBody();
    body["timeout"] = 30;

    EXPECT_EQ(ParseJobRequest(body, limits).timeout_s, 30);
}

TEST(JobRequest, RejectsWrongTraceTypeAndNonObjectBody) {
    auto body = ValidBody();
    body["trace"] = "yes";
    ExpectRejected(body);

    ExpectRejected(nlohmann::json::array());
    ExpectRejected(nlohmann::json("P -> P"));
}
