#include "service/sandbox_service.hpp"

#include "config/config_loader.hpp"
#include "utils/logging.hpp"

namespace safexec::service {
namespace {

executor::OrchestratorOptions OptionsFrom(const config::Config& config) {
    executor::OrchestratorOptions options{};
    options.python = config.execution.python;
    options.shell = config.execution.shell;
    options.install_network = config.execution.install_network;
    return options;
}

}  // namespace

SandboxService::SandboxService(const config::Config& config)
    : SandboxService(config, sandbox::BackendSelector::FromConfig(config)) {}

SandboxService::SandboxService(const config::Config& config, std::unique_ptr<sandbox::BackendSelector> selector)
    : config_(config)
    , sessions_(std::make_unique<session::SessionStore>(config::ExpandHome(config.workspace.root)))
    , selector_(std::move(selector))
    , orchestrator_(std::make_unique<executor::ExecutionOrchestrator>(
          *sessions_, *selector_, deps::DependencyResolver(), OptionsFrom(config))) {}

std::string SandboxService::ExecuteCode(const std::string& snippet,
                                        const session::SessionKey& key,
                                        std::optional<std::chrono::seconds> timeout) {
    return Dispatch(sandbox::RequestKind::kCode, snippet, key, timeout, nullptr).Text();
}

std::string SandboxService::ExecuteShell(const std::string& command,
                                         const session::SessionKey& key,
                                         std::optional<std::chrono::seconds> timeout) {
    return Dispatch(sandbox::RequestKind::kShell, command, key, timeout, nullptr).Text();
}

result::ExecutionResult SandboxService::Execute(sandbox::RequestKind kind,
                                                const std::string& payload,
                                                const session::SessionKey& key,
                                                std::optional<std::chrono::seconds> timeout) {
    return Dispatch(kind, payload, key, timeout, nullptr);
}

result::ExecutionResult SandboxService::ExecuteStreaming(sandbox::RequestKind kind,
                                                         const std::string& payload,
                                                         const session::SessionKey& key,
                                                         const executor::StreamSink& sink,
                                                         std::optional<std::chrono::seconds> timeout) {
    return Dispatch(kind, payload, key, timeout, &sink);
}

result::ExecutionResult SandboxService::Dispatch(sandbox::RequestKind kind,
                                                 const std::string& payload,
                                                 const session::SessionKey& key,
                                                 std::optional<std::chrono::seconds> timeout,
                                                 const executor::StreamSink* sink) {
    sandbox::ExecutionRequest request{};
    request.kind = kind;
    request.payload = payload;
    request.timeout = timeout.value_or(std::chrono::seconds(config_.execution.timeout_s));
    request.network = sandbox::NetworkPolicy::kDenied;
    try {
        auto session = sessions_->GetOrCreate(key.agent_id, key.conversation_id);
        return sink ? orchestrator_->RunStreaming(*session, request, *sink)
                    : orchestrator_->Run(*session, request);
    } catch (const session::SessionStoreError& ex) {
        utils::LogError("service", "session unavailable", {
            {"session", key.ToString()},
            {"error", ex.what()}
        });
        return result::FailureResult(result::Outcome::kEnvironmentError, ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        utils::LogError("service", "filesystem error", {
            {"session", key.ToString()},
            {"error", ex.what()}
        });
        return result::FailureResult(result::Outcome::kEnvironmentError, ex.what());
    }
}

}  // namespace safexec::service
