#include "sandbox/backend_selector.hpp"

#include "utils/logging.hpp"

namespace safexec::sandbox {

BackendSelector::BackendSelector(std::vector<std::unique_ptr<Backend>> backends, int failure_threshold)
    : backends_(std::move(backends))
    , failure_threshold_(failure_threshold < 1 ? 1 : failure_threshold) {}

std::unique_ptr<BackendSelector> BackendSelector::FromConfig(const config::Config& config) {
    std::vector<std::unique_ptr<Backend>> backends;
    std::set<BackendKind> seen;
    const auto probe_timeout = std::chrono::seconds(config.sandbox.probe_timeout_s);
    for (const auto& name : config.sandbox.order) {
        const auto kind = ParseBackendKind(name);
        if (!kind.has_value()) {
            utils::LogWarn("backend", "ignoring unknown backend in order", {{"name", name}});
            continue;
        }
        if (!seen.insert(*kind).second) {
            continue;
        }
        switch (*kind) {
            case BackendKind::kNamespace:
                backends.push_back(std::make_unique<NamespaceBackend>(config.sandbox.bwrap_path, probe_timeout));
                break;
            case BackendKind::kContainer:
                backends.push_back(std::make_unique<ContainerBackend>(
                    config.sandbox.docker_path,
                    config.sandbox.image,
                    probe_timeout,
                    config.workspace.host_working_directory));
                break;
            case BackendKind::kDirect:
                backends.push_back(std::make_unique<DirectBackend>(config.sandbox.allow_direct));
                break;
        }
    }
    return std::make_unique<BackendSelector>(std::move(backends), config.sandbox.failure_threshold);
}

bool BackendSelector::UsableLocked(Backend& backend) {
    const auto kind = backend.Kind();
    if (excluded_.count(kind) > 0) {
        return false;
    }
    auto it = probed_.find(kind);
    if (it == probed_.end()) {
        it = probed_.emplace(kind, backend.Probe()).first;
    }
    return it->second;
}

Backend& BackendSelector::Select() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (selected_ && excluded_.count(selected_->Kind()) == 0) {
        return *selected_;
    }
    selected_ = nullptr;
    for (auto& backend : backends_) {
        if (UsableLocked(*backend)) {
            selected_ = backend.get();
            break;
        }
    }
    if (!selected_) {
        throw NoBackendAvailableError("no sandbox backend is available on this host");
    }
    utils::LogInfo("backend", "selected", {{"backend", selected_->Name()}});
    return *selected_;
}

std::vector<Backend*> BackendSelector::Chain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Backend*> chain;
    for (auto& backend : backends_) {
        if (UsableLocked(*backend)) {
            chain.push_back(backend.get());
        }
    }
    return chain;
}

Backend* BackendSelector::Next(BackendKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool passed = false;
    for (auto& backend : backends_) {
        if (passed && UsableLocked(*backend)) {
            return backend.get();
        }
        if (backend->Kind() == kind) {
            passed = true;
        }
    }
    return nullptr;
}

Backend* BackendSelector::Find(BackendKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& backend : backends_) {
        if (backend->Kind() == kind) {
            return UsableLocked(*backend) ? backend.get() : nullptr;
        }
    }
    return nullptr;
}

void BackendSelector::ReportFailure(BackendKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int count = ++failures_[kind];
    utils::LogWarn("backend", "dispatch failed", {
        {"backend", ToString(kind)},
        {"failures", std::to_string(count)}
    });
    if (count >= failure_threshold_ && excluded_.insert(kind).second) {
        utils::LogWarn("backend", "excluded after repeated failures", {{"backend", ToString(kind)}});
        if (selected_ && selected_->Kind() == kind) {
            selected_ = nullptr;
        }
    }
}

void BackendSelector::ReportSuccess(BackendKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[kind] = 0;
}

std::vector<ProbeReport> BackendSelector::Reports() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProbeReport> reports;
    for (auto& backend : backends_) {
        ProbeReport report{};
        report.kind = backend->Kind();
        report.excluded = excluded_.count(report.kind) > 0;
        auto it = probed_.find(report.kind);
        if (it == probed_.end()) {
            it = probed_.emplace(report.kind, backend->Probe()).first;
        }
        report.available = it->second;
        reports.push_back(report);
    }
    return reports;
}

}  // namespace safexec::sandbox
