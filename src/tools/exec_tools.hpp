#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "service/sandbox_service.hpp"
#include "tools/tool.hpp"

namespace safexec::tools {

// Runs one request kind in a fixed session. The payload arrives in a single
// required string parameter; an optional integer "timeout" caps the call.
class SandboxTool : public Tool {
public:
    SandboxTool(service::SandboxService& service,
                session::SessionKey key,
                sandbox::RequestKind kind,
                std::string payload_param);

    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    service::SandboxService& service_;
    session::SessionKey key_;
    sandbox::RequestKind kind_;
    std::string payload_param_;
};

// Shell command inside the caller's session sandbox. The working directory
// carries over between calls.
class ExecTool : public SandboxTool {
public:
    ExecTool(service::SandboxService& service, session::SessionKey key)
        : SandboxTool(service, std::move(key), sandbox::RequestKind::kShell, "command") {}

    std::string Name() const override { return "exec"; }
    std::string Description() const override {
        return "Execute a shell command in the sandboxed session workspace.";
    }
};

class PythonTool : public SandboxTool {
public:
    PythonTool(service::SandboxService& service, session::SessionKey key)
        : SandboxTool(service, std::move(key), sandbox::RequestKind::kCode, "code") {}

    std::string Name() const override { return "python"; }
    std::string Description() const override {
        return "Run Python code in the sandboxed session workspace. Imported packages are installed "
               "automatically; network access is not available to the code itself.";
    }
};

// "timeout" parameter in seconds; nullopt when absent, invalid values included.
std::optional<std::chrono::seconds> ParseTimeoutParam(const ToolParams& params);

}  // namespace safexec::tools
