#include "sandbox/backend.hpp"

#include <filesystem>
#include <unistd.h>

#include "sandbox/boundary_builder.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace safexec::sandbox {
namespace {

constexpr auto kRemoveTimeout = std::chrono::seconds(30);

std::chrono::milliseconds ToMillis(std::chrono::seconds value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value);
}

std::string FirstLine(const std::string& text) {
    const auto end = text.find('\n');
    return utils::Trim(end == std::string::npos ? text : text.substr(0, end));
}

bool ProbeCommand(const std::vector<std::string>& argv, std::chrono::seconds timeout, std::string& detail) {
    LaunchSpec spec{};
    spec.argv = argv;
    const auto result = ProcessRunner::Run(spec, ToMillis(timeout));
    detail = FirstLine(result.output);
    return !result.spawn_failed && !result.timed_out && result.exit_code == 0;
}

DispatchResult SpawnFailure(ExecResult exec) {
    DispatchResult result{};
    result.backend_failed = true;
    result.failure_reason = exec.output;
    result.exec = std::move(exec);
    return result;
}

}  // namespace

bool StripStartMarker(std::string& output, const std::string& marker) {
    const auto line = marker + "\n";
    const auto pos = output.find(line);
    if (pos == std::string::npos) {
        return false;
    }
    output.erase(pos, line.size());
    return true;
}

StartMarkerFilter::StartMarkerFilter(std::string marker, ProcessRunner::OutputCallback forward)
    : line_(std::move(marker) + "\n")
    , forward_(std::move(forward)) {}

void StartMarkerFilter::Feed(const std::string& chunk) {
    if (seen_) {
        if (forward_) {
            forward_(chunk);
        }
        return;
    }
    pending_ += chunk;
    const auto pos = pending_.find(line_);
    if (pos != std::string::npos) {
        seen_ = true;
        const auto rest = pending_.substr(0, pos) + pending_.substr(pos + line_.size());
        pending_.clear();
        if (!rest.empty() && forward_) {
            forward_(rest);
        }
        return;
    }
    // hold back only a tail that could still begin the marker
    const auto keep = line_.size() - 1;
    if (pending_.size() > keep) {
        const auto head = pending_.substr(0, pending_.size() - keep);
        pending_.erase(0, pending_.size() - keep);
        if (forward_) {
            forward_(head);
        }
    }
}

void StartMarkerFilter::Flush() {
    if (!pending_.empty() && forward_) {
        forward_(pending_);
    }
    pending_.clear();
}

ExecResult Backend::Launch(const LaunchSpec& spec, const DispatchOptions& options, bool& started) {
    if (options.start_marker.empty()) {
        started = true;
        if (options.on_output || options.on_tick) {
            return ProcessRunner::RunStreaming(spec, options.timeout, options.on_output, options.on_tick,
                                               options.tick_interval);
        }
        return ProcessRunner::Run(spec, options.timeout);
    }
    if (options.on_output || options.on_tick) {
        StartMarkerFilter filter(options.start_marker, options.on_output);
        auto exec = ProcessRunner::RunStreaming(
            spec, options.timeout,
            [&filter](const std::string& chunk) { filter.Feed(chunk); },
            options.on_tick, options.tick_interval);
        filter.Flush();
        started = StripStartMarker(exec.output, options.start_marker);
        return exec;
    }
    auto exec = ProcessRunner::Run(spec, options.timeout);
    started = StripStartMarker(exec.output, options.start_marker);
    return exec;
}

DispatchResult Backend::Settle(ExecResult exec, bool started, const std::string& launcher) {
    DispatchResult result{};
    result.payload_started = started;
    // A timeout before the marker is still a timeout; the call is not retried.
    if (!started && !exec.timed_out) {
        result.backend_failed = true;
        const auto line = FirstLine(exec.output);
        result.failure_reason = line.empty()
            ? launcher + " exited with status " + std::to_string(exec.exit_code) + " before the payload started"
            : line;
    }
    result.exec = std::move(exec);
    return result;
}

NamespaceBackend::NamespaceBackend(std::string bwrap_path, std::chrono::seconds probe_timeout)
    : bwrap_path_(std::move(bwrap_path))
    , probe_timeout_(probe_timeout) {}

BackendCapabilities NamespaceBackend::Capabilities() const {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kNamespace;
    capabilities.binary = resolved_path_.empty() ? bwrap_path_ : resolved_path_;
    capabilities.network_control = true;
    return capabilities;
}

bool NamespaceBackend::Probe() {
    resolved_path_ = ProcessRunner::FindExecutable(bwrap_path_);
    if (resolved_path_.empty()) {
        utils::LogInfo("backend", "bwrap not found", {{"path", bwrap_path_}});
        return false;
    }
    std::string detail;
    if (!ProbeCommand({resolved_path_, "--version"}, probe_timeout_, detail)) {
        utils::LogInfo("backend", "bwrap version check failed", {{"detail", detail}});
        return false;
    }
    const auto version = detail;
    // User namespaces may be disabled even though the binary exists.
    if (!ProbeCommand({resolved_path_, "--die-with-parent", "--ro-bind", "/", "/", "--dev", "/dev",
                       "--unshare-pid", "--unshare-net", "--", "true"},
                      probe_timeout_, detail)) {
        utils::LogInfo("backend", "bwrap cannot create namespaces", {{"detail", detail}});
        return false;
    }
    utils::LogInfo("backend", "namespace sandbox available", {
        {"binary", resolved_path_},
        {"version", version}
    });
    return true;
}

DispatchResult NamespaceBackend::Dispatch(const BoundaryDescriptor& descriptor,
                                          const std::vector<std::string>& command,
                                          const DispatchOptions& options) {
    bool started = false;
    auto exec = Launch(RenderLaunch(descriptor, command), options, started);
    if (exec.spawn_failed) {
        return SpawnFailure(std::move(exec));
    }
    return Settle(std::move(exec), started, "bwrap");
}

ContainerBackend::ContainerBackend(std::string docker_path,
                                   std::string image,
                                   std::chrono::seconds probe_timeout,
                                   std::string host_working_directory)
    : docker_path_(std::move(docker_path))
    , image_(std::move(image))
    , probe_timeout_(probe_timeout)
    , host_working_directory_(std::move(host_working_directory)) {
    std::error_code ec;
    running_in_container_ = std::filesystem::exists("/.dockerenv", ec);
}

BackendCapabilities ContainerBackend::Capabilities() const {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kContainer;
    capabilities.binary = resolved_path_.empty() ? docker_path_ : resolved_path_;
    capabilities.network_control = true;
    capabilities.image = image_;
    capabilities.container_user = std::to_string(::getuid()) + ":" + std::to_string(::getgid());
    capabilities.host_working_directory = host_working_directory_;
    capabilities.running_in_container = running_in_container_;
    return capabilities;
}

bool ContainerBackend::Probe() {
    resolved_path_ = ProcessRunner::FindExecutable(docker_path_);
    if (resolved_path_.empty()) {
        utils::LogInfo("backend", "docker not found", {{"path", docker_path_}});
        return false;
    }
    std::string detail;
    if (!ProbeCommand({resolved_path_, "version", "--format", "{{.Server.Version}}"}, probe_timeout_, detail)) {
        utils::LogInfo("backend", "docker daemon unreachable", {{"detail", detail}});
        return false;
    }
    const auto version = detail;
    if (!ProbeCommand({resolved_path_, "image", "inspect", "--format", "{{.Id}}", image_}, probe_timeout_,
                      detail)) {
        utils::LogInfo("backend", "sandbox image missing", {{"image", image_}});
        return false;
    }
    utils::LogInfo("backend", "container engine available", {
        {"binary", resolved_path_},
        {"server", version},
        {"image", image_}
    });
    return true;
}

DispatchResult ContainerBackend::Dispatch(const BoundaryDescriptor& descriptor,
                                          const std::vector<std::string>& command,
                                          const DispatchOptions& options) {
    bool started = false;
    auto exec = Launch(RenderLaunch(descriptor, command), options, started);
    if (exec.spawn_failed) {
        return SpawnFailure(std::move(exec));
    }
    if (exec.timed_out && !descriptor.container_name.empty()) {
        // killing the client leaves the container running
        RemoveContainer(descriptor.container_name);
    }
    return Settle(std::move(exec), started, "docker");
}

void ContainerBackend::RemoveContainer(const std::string& name) const {
    LaunchSpec spec{};
    spec.argv = {resolved_path_.empty() ? docker_path_ : resolved_path_, "rm", "-f", name};
    const auto result = ProcessRunner::Run(spec, ToMillis(kRemoveTimeout));
    if (result.exit_code != 0) {
        utils::LogWarn("backend", "failed to remove container", {
            {"name", name},
            {"detail", FirstLine(result.output)}
        });
    }
}

DirectBackend::DirectBackend(bool enabled)
    : enabled_(enabled) {}

BackendCapabilities DirectBackend::Capabilities() const {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kDirect;
    capabilities.network_control = false;
    return capabilities;
}

bool DirectBackend::Probe() {
    if (!enabled_) {
        utils::LogInfo("backend", "direct execution disabled by configuration");
    }
    return enabled_;
}

DispatchResult DirectBackend::Dispatch(const BoundaryDescriptor& descriptor,
                                       const std::vector<std::string>& command,
                                       const DispatchOptions& options) {
    utils::LogWarn("backend", "UNSANDBOXED EXECUTION: running directly on the host", {
        {"workspace", descriptor.host_workspace},
        {"network", descriptor.NetworkEnabled() ? "allowed" : "not enforced"}
    });
    bool started = false;
    auto exec = Launch(RenderLaunch(descriptor, command), options, started);
    if (exec.spawn_failed) {
        return SpawnFailure(std::move(exec));
    }
    return Settle(std::move(exec), started, "shell");
}

}  // namespace safexec::sandbox
