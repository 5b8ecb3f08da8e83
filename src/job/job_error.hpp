#pragma once

#include <stdexcept>
#include <string>

namespace proverd::job {

enum class JobErrorKind {
    kInvalidRequest,
    kResource,
    kLaunch,
    kHarvest
};

inline const char* ToString(JobErrorKind kind) {
    switch (kind) {
        case JobErrorKind::kInvalidRequest: return "invalid_request";
        case JobErrorKind::kResource: return "resource";
        case JobErrorKind::kLaunch: return "launch";
        case JobErrorKind::kHarvest: return "harvest";
    }
    return "unknown";
}

// Fatal failure of one request. Only kInvalidRequest is the caller's fault.
class JobError : public std::runtime_error {
public:
    JobError(JobErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    JobErrorKind Kind() const { return kind_; }
    bool IsClientError() const { return kind_ == JobErrorKind::kInvalidRequest; }

private:
    JobErrorKind kind_;
};

}  // namespace proverd::job
