#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace safexec::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".safexec" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& object, const char* key, std::string& target) {
    if (object.contains(key) && object[key].is_string()) {
        target = object[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& object, const char* key, int& target) {
    if (object.contains(key) && object[key].is_number_integer()) {
        target = object[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& object, const char* key, bool& target) {
    if (object.contains(key) && object[key].is_boolean()) {
        target = object[key].get<bool>();
    }
}

}  // namespace

std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (utils::StartsWith(path, "~/")) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("workspace") && data["workspace"].is_object()) {
        const auto& workspace = data["workspace"];
        ReadString(workspace, "root", config.workspace.root);
        ReadString(workspace, "hostWorkingDirectory", config.workspace.host_working_directory);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("order") && sandbox["order"].is_array()) {
            config.sandbox.order.clear();
            for (const auto& item : sandbox["order"]) {
                if (item.is_string()) {
                    config.sandbox.order.push_back(item.get<std::string>());
                }
            }
        }
        ReadBool(sandbox, "allowDirect", config.sandbox.allow_direct);
        ReadString(sandbox, "bwrapPath", config.sandbox.bwrap_path);
        ReadString(sandbox, "dockerPath", config.sandbox.docker_path);
        ReadString(sandbox, "image", config.sandbox.image);
        ReadInt(sandbox, "probeTimeoutS", config.sandbox.probe_timeout_s);
        ReadInt(sandbox, "failureThreshold", config.sandbox.failure_threshold);
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadInt(execution, "timeoutS", config.execution.timeout_s);
        ReadString(execution, "python", config.execution.python);
        ReadString(execution, "shell", config.execution.shell);
        ReadBool(execution, "installNetwork", config.execution.install_network);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto root = GetEnvFallback("SAFEXEC_WORKSPACE__ROOT", "SAFEXEC_WORKSPACE_ROOT");
    if (!root.empty()) {
        config.workspace.root = root;
    }

    const auto host_working_directory = GetEnv("WORKING_DIRECTORY");
    if (!host_working_directory.empty()) {
        config.workspace.host_working_directory = host_working_directory;
    }

    const auto order = GetEnvFallback("SAFEXEC_SANDBOX__ORDER", "SAFEXEC_SANDBOX_ORDER");
    if (!order.empty()) {
        config.sandbox.order = utils::Split(order, ',');
    }

    const auto allow_direct = GetEnvFallback(
        "SAFEXEC_SANDBOX__ALLOW_DIRECT",
        "SAFEXEC_SANDBOX_ALLOW_DIRECT");
    if (!allow_direct.empty()) {
        config.sandbox.allow_direct = ParseBool(allow_direct);
    }

    const auto bwrap_path = GetEnvFallback("SAFEXEC_SANDBOX__BWRAP_PATH", "SAFEXEC_SANDBOX_BWRAP_PATH");
    if (!bwrap_path.empty()) {
        config.sandbox.bwrap_path = bwrap_path;
    }

    const auto docker_path = GetEnvFallback("SAFEXEC_SANDBOX__DOCKER_PATH", "SAFEXEC_SANDBOX_DOCKER_PATH");
    if (!docker_path.empty()) {
        config.sandbox.docker_path = docker_path;
    }

    const auto image = GetEnvFallback("SAFEXEC_SANDBOX__IMAGE", "SAFEXEC_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto probe_timeout = GetEnvFallback(
        "SAFEXEC_SANDBOX__PROBE_TIMEOUT_S",
        "SAFEXEC_SANDBOX_PROBE_TIMEOUT_S");
    if (!probe_timeout.empty()) {
        config.sandbox.probe_timeout_s = ParseInt(probe_timeout, config.sandbox.probe_timeout_s);
    }

    const auto failure_threshold = GetEnvFallback(
        "SAFEXEC_SANDBOX__FAILURE_THRESHOLD",
        "SAFEXEC_SANDBOX_FAILURE_THRESHOLD");
    if (!failure_threshold.empty()) {
        config.sandbox.failure_threshold = ParseInt(failure_threshold, config.sandbox.failure_threshold);
    }

    const auto timeout = GetEnvFallback("SAFEXEC_EXECUTION__TIMEOUT_S", "SAFEXEC_EXECUTION_TIMEOUT_S");
    if (!timeout.empty()) {
        config.execution.timeout_s = ParseInt(timeout, config.execution.timeout_s);
    }

    const auto python = GetEnvFallback("SAFEXEC_EXECUTION__PYTHON", "SAFEXEC_EXECUTION_PYTHON");
    if (!python.empty()) {
        config.execution.python = python;
    }

    const auto shell = GetEnvFallback("SAFEXEC_EXECUTION__SHELL", "SAFEXEC_EXECUTION_SHELL");
    if (!shell.empty()) {
        config.execution.shell = shell;
    }

    const auto install_network = GetEnvFallback(
        "SAFEXEC_EXECUTION__INSTALL_NETWORK",
        "SAFEXEC_EXECUTION_INSTALL_NETWORK");
    if (!install_network.empty()) {
        config.execution.install_network = ParseBool(install_network);
    }

    const auto log_level = GetEnvFallback("SAFEXEC_LOGGING__LEVEL", "SAFEXEC_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring unreadable config file", {
                {"path", config_path.string()},
                {"error", ex.what()}
            });
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace safexec::config
