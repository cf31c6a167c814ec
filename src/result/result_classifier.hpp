#pragma once

#include <string>
#include <vector>

namespace safexec::result {

enum class Outcome {
    kSuccess,
    kRuntimeFailure,
    kTimeout,
    kBackendFailure,
    kEnvironmentError,
    kBoundaryError
};

inline const char* ToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::kSuccess: return "success";
        case Outcome::kRuntimeFailure: return "runtime_failure";
        case Outcome::kTimeout: return "timeout";
        case Outcome::kBackendFailure: return "backend_failure";
        case Outcome::kEnvironmentError: return "environment_error";
        case Outcome::kBoundaryError: return "boundary_error";
    }
    return "unknown";
}

struct ExecutionResult {
    int exit_code = -1;
    std::string output;
    bool success = false;
    Outcome outcome = Outcome::kRuntimeFailure;
    // Empty on success.
    std::string guidance;

    // Output with guidance appended, as returned to callers.
    std::string Text() const { return output + guidance; }
};

const std::vector<std::string>& ErrorSignatures();
const std::string& RemediationGuidance();

// Index into ErrorSignatures() of the first signature found, or -1.
int FindErrorSignature(const std::string& output);

ExecutionResult Classify(int exit_code, const std::string& output);
ExecutionResult TimeoutResult(const std::string& output, int timeout_s);
// Environment and boundary failures, rendered in the caller-facing error form.
ExecutionResult FailureResult(Outcome outcome, const std::string& message);

}  // namespace safexec::result
