#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/backend.hpp"

namespace safexec::sandbox {

class NoBackendAvailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProbeReport {
    BackendKind kind = BackendKind::kNamespace;
    bool available = false;
    bool excluded = false;
};

// Ordered fallback chain over the configured backends. Each backend is probed
// at most once per process; a backend that fails `failure_threshold` times in
// a row is excluded and the selection moves down the chain.
class BackendSelector {
public:
    BackendSelector(std::vector<std::unique_ptr<Backend>> backends, int failure_threshold);

    static std::unique_ptr<BackendSelector> FromConfig(const config::Config& config);

    // First usable backend; throws NoBackendAvailableError when none is.
    Backend& Select();
    // Usable backends in trust order.
    std::vector<Backend*> Chain();
    // Usable backend after `kind` in the chain, or nullptr.
    Backend* Next(BackendKind kind);
    // Usable backend of `kind`, or nullptr.
    Backend* Find(BackendKind kind);

    void ReportFailure(BackendKind kind);
    void ReportSuccess(BackendKind kind);

    std::vector<ProbeReport> Reports();

private:
    bool UsableLocked(Backend& backend);

    std::vector<std::unique_ptr<Backend>> backends_;
    int failure_threshold_;
    std::map<BackendKind, bool> probed_;
    std::map<BackendKind, int> failures_;
    std::set<BackendKind> excluded_;
    Backend* selected_ = nullptr;
    std::mutex mutex_;
};

}  // namespace safexec::sandbox
