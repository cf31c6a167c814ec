#include "tools/exec_tools.hpp"

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace safexec::tools {

std::optional<std::chrono::seconds> ParseTimeoutParam(const ToolParams& params) {
    auto it = params.find("timeout");
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    try {
        const auto seconds = std::stoi(it->second);
        if (seconds > 0) {
            return std::chrono::seconds(seconds);
        }
    } catch (const std::exception&) {
        utils::LogWarn("tool", "ignoring invalid timeout", {{"value", it->second}});
    }
    return std::nullopt;
}

SandboxTool::SandboxTool(service::SandboxService& service,
                         session::SessionKey key,
                         sandbox::RequestKind kind,
                         std::string payload_param)
    : service_(service)
    , key_(std::move(key))
    , kind_(kind)
    , payload_param_(std::move(payload_param)) {}

std::string SandboxTool::ParametersJson() const {
    const nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {payload_param_, {{"type", "string"}}},
            {"timeout", {{"type", "integer"}}}
        }},
        {"required", {payload_param_}}
    };
    return schema.dump();
}

std::string SandboxTool::Execute(const ToolParams& params) {
    auto it = params.find(payload_param_);
    if (it == params.end() || it->second.empty()) {
        return "Error: missing " + payload_param_;
    }
    const auto timeout = ParseTimeoutParam(params);
    const auto output = kind_ == sandbox::RequestKind::kShell
        ? service_.ExecuteShell(it->second, key_, timeout)
        : service_.ExecuteCode(it->second, key_, timeout);
    return output.empty() ? "(no output)" : output;
}

}  // namespace safexec::tools
