#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "executor/execution_orchestrator.hpp"
#include "sandbox/backend_selector.hpp"
#include "session/session_store.hpp"

namespace safexec::service {

// Owns the session registry, the backend chain and the orchestrator for one
// host process. Every entry point returns a result; nothing is thrown past it.
class SandboxService {
public:
    explicit SandboxService(const config::Config& config);
    // For callers that assemble their own backend chain.
    SandboxService(const config::Config& config, std::unique_ptr<sandbox::BackendSelector> selector);

    std::string ExecuteCode(const std::string& snippet,
                            const session::SessionKey& key,
                            std::optional<std::chrono::seconds> timeout = std::nullopt);
    std::string ExecuteShell(const std::string& command,
                             const session::SessionKey& key,
                             std::optional<std::chrono::seconds> timeout = std::nullopt);

    result::ExecutionResult Execute(sandbox::RequestKind kind,
                                    const std::string& payload,
                                    const session::SessionKey& key,
                                    std::optional<std::chrono::seconds> timeout = std::nullopt);
    result::ExecutionResult ExecuteStreaming(sandbox::RequestKind kind,
                                             const std::string& payload,
                                             const session::SessionKey& key,
                                             const executor::StreamSink& sink,
                                             std::optional<std::chrono::seconds> timeout = std::nullopt);

    session::SessionStore& Sessions() { return *sessions_; }
    sandbox::BackendSelector& Selector() { return *selector_; }

private:
    result::ExecutionResult Dispatch(sandbox::RequestKind kind,
                                     const std::string& payload,
                                     const session::SessionKey& key,
                                     std::optional<std::chrono::seconds> timeout,
                                     const executor::StreamSink* sink);

    config::Config config_;
    std::unique_ptr<session::SessionStore> sessions_;
    std::unique_ptr<sandbox::BackendSelector> selector_;
    std::unique_ptr<executor::ExecutionOrchestrator> orchestrator_;
};

}  // namespace safexec::service
