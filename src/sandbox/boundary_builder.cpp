#include "sandbox/boundary_builder.hpp"

#include <cstdlib>
#include <filesystem>

#include "utils/common.hpp"

namespace safexec::sandbox {
namespace {

constexpr const char* kSandboxPath = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
constexpr const char* kHostname = "safexec";

// Top-level directories that are symlinks into /usr on usr-merged hosts.
const std::vector<std::string>& SystemRoots() {
    static const std::vector<std::string> kRoots = {"/bin", "/sbin", "/lib", "/lib64", "/lib32"};
    return kRoots;
}

const std::vector<std::string>& SystemFiles() {
    static const std::vector<std::string> kFiles = {
        "/etc/alternatives",
        "/etc/ssl",
        "/etc/ca-certificates",
        "/etc/pki",
        "/etc/resolv.conf",
        "/etc/hosts",
        "/etc/nsswitch.conf",
        "/etc/passwd",
        "/etc/group",
        "/etc/localtime",
        "/etc/ld.so.cache",
        "/etc/ld.so.conf",
        "/etc/ld.so.conf.d"
    };
    return kFiles;
}

std::vector<MountBinding> SystemMounts() {
    std::vector<MountBinding> mounts;
    mounts.push_back(MountBinding{"/usr", "/usr", true, false, false});
    for (const auto& root : SystemRoots()) {
        std::error_code ec;
        if (std::filesystem::is_symlink(root, ec)) {
            const auto target = std::filesystem::read_symlink(root, ec);
            if (!ec) {
                mounts.push_back(MountBinding{target.string(), root, true, false, true});
                continue;
            }
        }
        mounts.push_back(MountBinding{root, root, true, true, false});
    }
    for (const auto& path : SystemFiles()) {
        mounts.push_back(MountBinding{path, path, true, true, false});
    }
    return mounts;
}

std::string StripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string HostPathVariable() {
    const char* value = std::getenv("PATH");
    return value && *value ? std::string(value) : std::string(kSandboxPath);
}

void AppendNamespaceArgs(const BoundaryDescriptor& descriptor, std::vector<std::string>& argv) {
    argv.push_back(descriptor.launcher.empty() ? "bwrap" : descriptor.launcher);
    argv.push_back("--die-with-parent");
    argv.push_back("--new-session");
    if (descriptor.unshare_pid) {
        argv.push_back("--unshare-pid");
    }
    if (descriptor.unshare_ipc) {
        argv.push_back("--unshare-ipc");
    }
    if (descriptor.unshare_uts) {
        argv.push_back("--unshare-uts");
        argv.push_back("--hostname");
        argv.push_back(kHostname);
    }
    if (descriptor.unshare_net) {
        argv.push_back("--unshare-net");
    }
    argv.push_back("--clearenv");
    for (const auto& [key, value] : descriptor.env) {
        argv.push_back("--setenv");
        argv.push_back(key);
        argv.push_back(value);
    }
    for (const auto& mount : descriptor.mounts) {
        if (mount.symlink) {
            argv.push_back("--symlink");
        } else if (!mount.read_only) {
            argv.push_back(mount.optional ? "--bind-try" : "--bind");
        } else {
            argv.push_back(mount.optional ? "--ro-bind-try" : "--ro-bind");
        }
        argv.push_back(mount.host_path);
        argv.push_back(mount.sandbox_path);
    }
    argv.insert(argv.end(), {"--proc", "/proc", "--dev", "/dev", "--tmpfs", "/tmp"});
    argv.push_back("--chdir");
    argv.push_back(descriptor.sandbox_root);
    argv.push_back("--");
}

void AppendContainerArgs(const BoundaryDescriptor& descriptor, std::vector<std::string>& argv) {
    argv.push_back(descriptor.launcher.empty() ? "docker" : descriptor.launcher);
    argv.insert(argv.end(), {"run", "--rm", "--init"});
    if (!descriptor.container_name.empty()) {
        argv.push_back("--name");
        argv.push_back(descriptor.container_name);
    }
    argv.push_back("--hostname");
    argv.push_back(kHostname);
    argv.push_back("--network");
    argv.push_back(descriptor.unshare_net ? "none" : "bridge");
    argv.push_back("--security-opt");
    argv.push_back("no-new-privileges");
    if (!descriptor.container_user.empty()) {
        argv.push_back("--user");
        argv.push_back(descriptor.container_user);
    }
    for (const auto& mount : descriptor.mounts) {
        argv.push_back("-v");
        argv.push_back(mount.host_path + ":" + mount.sandbox_path + (mount.read_only ? ":ro" : ":rw"));
    }
    argv.push_back("-w");
    argv.push_back(descriptor.sandbox_root);
    for (const auto& [key, value] : descriptor.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    argv.push_back(descriptor.image);
}

}  // namespace

std::string TranslateVolumePath(const std::string& path,
                                const std::string& root,
                                const BackendCapabilities& capabilities) {
    if (!capabilities.running_in_container || capabilities.host_working_directory.empty()) {
        return path;
    }
    const auto host = StripTrailingSlash(capabilities.host_working_directory);
    const auto local_root = StripTrailingSlash(root);
    if (path == local_root) {
        return host;
    }
    if (!local_root.empty() && utils::StartsWith(path, local_root + "/")) {
        return host + path.substr(local_root.size());
    }
    static const std::string kMarker = "/WORKSPACE";
    const auto pos = path.find(kMarker + "/");
    if (pos != std::string::npos) {
        return host + path.substr(pos + kMarker.size());
    }
    return path;
}

std::string MapSandboxToHost(const std::string& sandbox_path, const std::string& host_workspace) {
    const std::string root = kSandboxRoot;
    if (sandbox_path == root) {
        return host_workspace;
    }
    if (utils::StartsWith(sandbox_path, root + "/")) {
        return host_workspace + sandbox_path.substr(root.size());
    }
    return sandbox_path;
}

std::string MapHostToSandbox(const std::string& host_path, const std::string& host_workspace) {
    if (host_path == host_workspace) {
        return kSandboxRoot;
    }
    if (utils::StartsWith(host_path, host_workspace + "/")) {
        return std::string(kSandboxRoot) + host_path.substr(host_workspace.size());
    }
    return host_path;
}

BoundaryDescriptor BuildBoundary(const session::Session& session,
                                 const ExecutionRequest& request,
                                 const BackendCapabilities& capabilities) {
    if (request.kind == RequestKind::kShell && !capabilities.supports_shell) {
        throw UnsupportedModeError(std::string("backend ") + ToString(capabilities.kind) +
                                   " cannot run shell commands");
    }
    if (request.kind == RequestKind::kCode && !capabilities.supports_code) {
        throw UnsupportedModeError(std::string("backend ") + ToString(capabilities.kind) +
                                   " cannot run interpreted code");
    }

    BoundaryDescriptor descriptor{};
    descriptor.backend = capabilities.kind;
    descriptor.launcher = capabilities.binary;
    descriptor.unshare_net = request.network == NetworkPolicy::kDenied;
    const bool install = request.phase == ExecutionPhase::kInstall;
    const auto workspace = session.Workspace().string();
    const auto call_dir = CallDirectory(session, request.call_id);
    const auto call_in = (call_dir / "in").string();
    const auto call_out = (call_dir / "out").string();
    const auto cwd = session.Cwd();

    switch (capabilities.kind) {
        case BackendKind::kNamespace:
            descriptor.mounts = SystemMounts();
            descriptor.mounts.push_back(MountBinding{workspace, kSandboxRoot, false, false, false});
            descriptor.mounts.push_back(MountBinding{call_in, kCallInDir, true, false, false});
            descriptor.mounts.push_back(MountBinding{call_out, kCallOutDir, false, false, false});
            descriptor.host_workspace = workspace;
            descriptor.working_dir = cwd;
            descriptor.call_in_dir = kCallInDir;
            descriptor.call_out_dir = kCallOutDir;
            break;
        case BackendKind::kContainer: {
            const auto root = session.Directory().parent_path().string();
            descriptor.host_workspace = TranslateVolumePath(workspace, root, capabilities);
            descriptor.mounts.push_back(
                MountBinding{descriptor.host_workspace, kSandboxRoot, false, false, false});
            descriptor.mounts.push_back(
                MountBinding{TranslateVolumePath(call_in, root, capabilities), kCallInDir, true, false, false});
            descriptor.mounts.push_back(
                MountBinding{TranslateVolumePath(call_out, root, capabilities), kCallOutDir, false, false, false});
            descriptor.image = capabilities.image;
            descriptor.container_user = capabilities.container_user;
            if (!request.call_id.empty()) {
                descriptor.container_name = "safexec-" + request.call_id + (install ? "-install" : "");
            }
            descriptor.working_dir = cwd;
            descriptor.call_in_dir = kCallInDir;
            descriptor.call_out_dir = kCallOutDir;
            break;
        }
        case BackendKind::kDirect:
            // Nothing is unshared or mounted; paths are rewritten onto the host workspace.
            descriptor.host_workspace = workspace;
            descriptor.sandbox_root = workspace;
            descriptor.working_dir = MapSandboxToHost(cwd, workspace);
            descriptor.call_in_dir = call_in;
            descriptor.call_out_dir = call_out;
            break;
    }

    const auto& root = descriptor.sandbox_root;
    descriptor.env = {
        {"HOME", install ? std::string("/tmp") : root},
        {"PATH", capabilities.kind == BackendKind::kDirect ? HostPathVariable() : kSandboxPath},
        {"PYTHONUNBUFFERED", "1"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PIP_DISABLE_PIP_VERSION_CHECK", "1"},
        {"LANG", "C.UTF-8"},
        {"SAFEXEC_WORKSPACE", root},
        {"SAFEXEC_EVENTS_FILE", descriptor.call_out_dir + "/events.jsonl"}
    };
    if (install) {
        // pip must not pick up configuration the workspace could have planted
        descriptor.env.emplace_back("PIP_CONFIG_FILE", "/dev/null");
        descriptor.working_dir = "/tmp";
    } else {
        descriptor.env.emplace_back("PYTHONPATH", root + "/" + kPackagesDir);
    }
    return descriptor;
}

std::filesystem::path CallDirectory(const session::Session& session, const std::string& call_id) {
    return session.StateDir() / ("call-" + call_id);
}

std::string ScriptPrologue(const BoundaryDescriptor& descriptor) {
    const auto dir = descriptor.working_dir.empty() ? descriptor.sandbox_root : descriptor.working_dir;
    return "cd -- " + utils::ShellQuote(dir) + " || exit 1\n";
}

LaunchSpec RenderLaunch(const BoundaryDescriptor& descriptor, const std::vector<std::string>& command) {
    LaunchSpec spec{};
    switch (descriptor.backend) {
        case BackendKind::kNamespace:
            AppendNamespaceArgs(descriptor, spec.argv);
            break;
        case BackendKind::kContainer:
            AppendContainerArgs(descriptor, spec.argv);
            break;
        case BackendKind::kDirect:
            spec.clear_env = true;
            spec.env = descriptor.env;
            spec.working_dir = descriptor.host_workspace;
            break;
    }
    spec.argv.insert(spec.argv.end(), command.begin(), command.end());
    return spec;
}

}  // namespace safexec::sandbox
