#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace safexec::sandbox {

// Fixed mount point of the session workspace inside every sandbox.
inline constexpr const char* kSandboxRoot = "/workspace";
// Per-session installed packages, relative to the sandbox root.
inline constexpr const char* kPackagesDir = ".safexec/site-packages";
// Per-call staging mounts: scripts (read-only) and results the sandbox writes.
inline constexpr const char* kCallInDir = "/run/safexec/in";
inline constexpr const char* kCallOutDir = "/run/safexec/out";

enum class BackendKind {
    kNamespace,
    kContainer,
    kDirect
};

inline const char* ToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::kNamespace: return "namespace";
        case BackendKind::kContainer: return "container";
        case BackendKind::kDirect: return "direct";
    }
    return "unknown";
}

inline std::optional<BackendKind> ParseBackendKind(const std::string& name) {
    if (name == "namespace" || name == "bwrap") {
        return BackendKind::kNamespace;
    }
    if (name == "container" || name == "docker") {
        return BackendKind::kContainer;
    }
    if (name == "direct") {
        return BackendKind::kDirect;
    }
    return std::nullopt;
}

enum class RequestKind {
    kCode,
    kShell
};

inline const char* ToString(RequestKind kind) {
    return kind == RequestKind::kCode ? "code" : "shell";
}

// A code call may dispatch twice: once to install packages, once to run.
enum class ExecutionPhase {
    kInstall,
    kRun
};

enum class NetworkPolicy {
    kDenied,
    kAllowed
};

struct ExecutionRequest {
    RequestKind kind = RequestKind::kCode;
    std::string payload;
    std::chrono::seconds timeout{300};
    NetworkPolicy network = NetworkPolicy::kDenied;
    ExecutionPhase phase = ExecutionPhase::kRun;
    // Unique per call; names staged files and containers.
    std::string call_id;
};

struct MountBinding {
    std::string host_path;
    std::string sandbox_path;
    bool read_only = true;
    // Skipped by the backend when the host path does not exist.
    bool optional = false;
    // Recreate as a symlink to `host_path` instead of binding (usr-merged /bin, /lib).
    bool symlink = false;
};

struct BoundaryDescriptor {
    BackendKind backend = BackendKind::kNamespace;
    std::vector<MountBinding> mounts;
    bool unshare_pid = true;
    bool unshare_ipc = true;
    bool unshare_uts = true;
    bool unshare_net = true;
    std::vector<std::pair<std::string, std::string>> env;
    // Working directory for the payload, as seen inside the sandbox.
    std::string working_dir;
    // Where the workspace appears to the sandboxed process.
    std::string sandbox_root = kSandboxRoot;
    // Host-side workspace path, already translated for the container engine.
    std::string host_workspace;
    // Staged scripts and sandbox-written results of this call, as the payload
    // sees them.
    std::string call_in_dir;
    std::string call_out_dir;
    // bwrap or docker binary; unused by the direct backend.
    std::string launcher;
    std::string container_name;
    std::string container_user;
    std::string image;

    bool NetworkEnabled() const { return !unshare_net; }
};

// What a backend can express; the boundary builder consults nothing else.
struct BackendCapabilities {
    BackendKind kind = BackendKind::kNamespace;
    std::string binary;
    bool supports_code = true;
    bool supports_shell = true;
    bool network_control = true;
    std::string image;
    // "uid:gid" the container runs as so workspace files stay host-owned.
    std::string container_user;
    // Docker-in-docker: host path that backs the local workspace root.
    std::string host_working_directory;
    bool running_in_container = false;
};

// Fully rendered process invocation for one phase of a call.
struct LaunchSpec {
    std::vector<std::string> argv;
    // When set the child gets exactly `env`; otherwise it inherits ours.
    bool clear_env = false;
    std::vector<std::pair<std::string, std::string>> env;
    std::string working_dir;
};

}  // namespace safexec::sandbox
