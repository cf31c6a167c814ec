#pragma once

#include <string>
#include <vector>

namespace safexec::config {

struct WorkspaceConfig {
    std::string root = "~/.safexec/workspaces";
    // Host path of the workspace root when safexec itself runs in a container.
    std::string host_working_directory;
};

struct SandboxConfig {
    std::vector<std::string> order = {"namespace", "container", "direct"};
    bool allow_direct = true;
    std::string bwrap_path = "bwrap";
    std::string docker_path = "docker";
    std::string image = "joshxt/safeexecute:latest";
    int probe_timeout_s = 5;
    int failure_threshold = 2;
};

struct ExecutionConfig {
    int timeout_s = 300;
    std::string python = "python3";
    std::string shell = "/bin/bash";
    bool install_network = true;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    WorkspaceConfig workspace;
    SandboxConfig sandbox;
    ExecutionConfig execution;
    LoggingConfig logging;
};

}  // namespace safexec::config
