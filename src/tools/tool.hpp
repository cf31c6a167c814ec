#pragma once

#include <string>
#include <unordered_map>

namespace safexec::tools {

// Arguments of one tool call, already flattened to strings by the caller.
using ToolParams = std::unordered_map<std::string, std::string>;

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema of the accepted parameters.
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const ToolParams& params) = 0;

    ToolDefinition Definition() const { return ToolDefinition{Name(), Description(), ParametersJson()}; }
};

}  // namespace safexec::tools
