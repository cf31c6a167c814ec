#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "service/sandbox_service.hpp"
#include "tools/exec_tools.hpp"
#include "tools/tool_registry.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

struct CliOptions {
    std::string agent = "cli";
    std::string conversation = "default";
    std::optional<std::chrono::seconds> timeout;
    bool stream = false;
    bool purge = false;
    std::vector<std::string> positional;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  safexec code <file|->        run Python code\n"
              << "  safexec shell <command...>   run a shell command\n"
              << "  safexec tool <name> key=value...\n"
              << "  safexec tools                list tool definitions\n"
              << "  safexec sessions             list known sessions\n"
              << "  safexec evict <agent> <conversation> [--purge]\n"
              << "  safexec probe                show backend availability\n"
              << "Options: --agent ID --conversation ID --timeout SECONDS --stream" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options{};
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cout << "Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--agent") {
            auto value = next_value("--agent");
            if (!value) {
                return std::nullopt;
            }
            options.agent = *value;
        } else if (arg == "--conversation") {
            auto value = next_value("--conversation");
            if (!value) {
                return std::nullopt;
            }
            options.conversation = *value;
        } else if (arg == "--timeout") {
            auto value = next_value("--timeout");
            if (!value) {
                return std::nullopt;
            }
            try {
                options.timeout = std::chrono::seconds(std::stoi(*value));
            } catch (const std::exception&) {
                std::cout << "Invalid timeout: " << *value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--stream") {
            options.stream = true;
        } else if (arg == "--purge") {
            options.purge = true;
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

std::optional<std::string> ReadSource(const std::string& path) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    buffer << input.rdbuf();
    return buffer.str();
}

int RunPayload(safexec::service::SandboxService& service,
               safexec::sandbox::RequestKind kind,
               const std::string& payload,
               const CliOptions& options) {
    const safexec::session::SessionKey key{options.agent, options.conversation};
    if (!options.stream) {
        const auto result = service.Execute(kind, payload, key, options.timeout);
        std::cout << result.Text();
        if (!result.output.empty() && result.output.back() != '\n' && result.guidance.empty()) {
            std::cout << std::endl;
        }
        return result.success ? 0 : 1;
    }

    const auto result = service.ExecuteStreaming(
        kind,
        payload,
        key,
        [](const safexec::executor::StreamEvent& event) {
            if (event.type == "output") {
                std::cout << event.content << std::flush;
            } else if (event.type != "error") {
                std::cerr << "[" << event.type << "] " << event.content << std::endl;
            }
        },
        options.timeout);
    if (!result.success) {
        // runtime and timeout output already went out as it arrived
        if (result.outcome != safexec::result::Outcome::kRuntimeFailure &&
            result.outcome != safexec::result::Outcome::kTimeout) {
            std::cout << result.output;
        }
        std::cout << result.guidance << std::endl;
    }
    return result.success ? 0 : 1;
}

int RunTool(safexec::service::SandboxService& service, const CliOptions& options) {
    if (options.positional.empty()) {
        std::cout << "Usage: safexec tool <name> key=value..." << std::endl;
        return 1;
    }
    const safexec::session::SessionKey key{options.agent, options.conversation};
    safexec::tools::ToolRegistry registry;
    registry.Register(std::make_unique<safexec::tools::ExecTool>(service, key));
    registry.Register(std::make_unique<safexec::tools::PythonTool>(service, key));

    safexec::tools::ToolParams params;
    for (std::size_t i = 1; i < options.positional.size(); ++i) {
        const auto& item = options.positional[i];
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            std::cout << "Expected key=value, got: " << item << std::endl;
            return 1;
        }
        params[item.substr(0, eq)] = item.substr(eq + 1);
    }
    if (options.timeout) {
        params["timeout"] = std::to_string(options.timeout->count());
    }
    std::cout << registry.Execute(options.positional.front(), params) << std::endl;
    return 0;
}

int ListTools(safexec::service::SandboxService& service, const CliOptions& options) {
    const safexec::session::SessionKey key{options.agent, options.conversation};
    safexec::tools::ToolRegistry registry;
    registry.Register(std::make_unique<safexec::tools::ExecTool>(service, key));
    registry.Register(std::make_unique<safexec::tools::PythonTool>(service, key));
    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : registry.GetDefinitions()) {
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

int ListSessions(safexec::service::SandboxService& service) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& info : service.Sessions().ListSessions()) {
        json.push_back({
            {"agent_id", info.agent_id},
            {"conversation_id", info.conversation_id},
            {"workspace", info.workspace},
            {"cwd", info.cwd},
            {"backend", info.backend.empty() ? nlohmann::json(nullptr) : nlohmann::json(info.backend)},
            {"created_at", info.created_at},
            {"updated_at", info.updated_at}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

int Evict(safexec::service::SandboxService& service, const CliOptions& options) {
    if (options.positional.size() < 2) {
        std::cout << "Usage: safexec evict <agent> <conversation> [--purge]" << std::endl;
        return 1;
    }
    const safexec::session::SessionKey key{options.positional[0], options.positional[1]};
    if (!service.Sessions().Evict(key, options.purge)) {
        std::cout << "No such session: " << key.ToString() << std::endl;
        return 1;
    }
    std::cout << "Evicted " << key.ToString() << (options.purge ? " (workspace removed)" : "") << std::endl;
    return 0;
}

int Probe(safexec::service::SandboxService& service) {
    for (const auto& report : service.Selector().Reports()) {
        std::cout << safexec::sandbox::ToString(report.kind) << ": "
                  << (report.available ? "available" : "unavailable")
                  << (report.excluded ? " (excluded)" : "") << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage();
        return 0;
    }
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        return 1;
    }

    auto config = safexec::config::LoadConfig();
    safexec::utils::Logger::Instance().Configure(
        safexec::utils::LogConfig{safexec::utils::ParseLogLevel(config.logging.level, safexec::utils::LogLevel::kInfo)});

    std::unique_ptr<safexec::service::SandboxService> service;
    try {
        service = std::make_unique<safexec::service::SandboxService>(config);
    } catch (const safexec::session::SessionStoreError& ex) {
        std::cout << "Failed to open workspace root: " << ex.what() << std::endl;
        return 1;
    }

    if (command == "code") {
        if (options->positional.empty()) {
            std::cout << "Usage: safexec code <file|->" << std::endl;
            return 1;
        }
        const auto source = ReadSource(options->positional.front());
        if (!source) {
            std::cout << "Cannot read " << options->positional.front() << std::endl;
            return 1;
        }
        return RunPayload(*service, safexec::sandbox::RequestKind::kCode, *source, *options);
    }
    if (command == "shell") {
        if (options->positional.empty()) {
            std::cout << "Usage: safexec shell <command...>" << std::endl;
            return 1;
        }
        return RunPayload(*service, safexec::sandbox::RequestKind::kShell,
                          safexec::utils::Join(options->positional, " "), *options);
    }
    if (command == "tool") {
        return RunTool(*service, *options);
    }
    if (command == "tools") {
        return ListTools(*service, *options);
    }
    if (command == "sessions") {
        return ListSessions(*service);
    }
    if (command == "evict") {
        return Evict(*service, *options);
    }
    if (command == "probe") {
        return Probe(*service);
    }

    PrintUsage();
    return 1;
}
