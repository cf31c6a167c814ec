#include "tools/tool_registry.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace safexec::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& name : List()) {
        defs.push_back(tools_.at(name)->Definition());
    }
    return defs;
}

std::string ToolRegistry::Execute(const std::string& name, const ToolParams& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    std::unordered_map<std::string, std::string> fields{{"name", name}};
    for (const auto& [key, value] : params) {
        fields["param." + key] = value.size() > 80 ? value.substr(0, 80) + "..." : value;
    }
    utils::LogDebug("tool", "start", std::move(fields));
    const auto result = tool->Execute(params);
    utils::LogDebug("tool", "end", {{"name", name}, {"size", std::to_string(result.size())}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace safexec::tools
