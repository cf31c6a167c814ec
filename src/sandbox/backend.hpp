#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/process_runner.hpp"
#include "sandbox/sandbox_types.hpp"

namespace safexec::sandbox {

struct DispatchOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    // When either callback is set the call streams through RunStreaming.
    ProcessRunner::OutputCallback on_output;
    ProcessRunner::TickCallback on_tick;
    std::chrono::milliseconds tick_interval{500};
    // Line the staged script prints before anything else. Its presence in the
    // output proves the launcher handed control to the script; it is removed
    // from the output. Empty means the caller cannot tell, and the run is
    // treated as started.
    std::string start_marker;
};

struct DispatchResult {
    ExecResult exec;
    bool payload_started = false;
    // The backend itself broke (launcher missing, daemon gone, namespace setup
    // refused) before the staged script ran. Never set once it started.
    bool backend_failed = false;
    std::string failure_reason;
};

class Backend {
public:
    virtual ~Backend() = default;

    virtual BackendKind Kind() const = 0;
    virtual std::string Name() const { return ToString(Kind()); }
    virtual BackendCapabilities Capabilities() const = 0;

    // Checks that the backend can run anything at all on this host.
    virtual bool Probe() = 0;

    // Runs `command` inside `descriptor`.
    virtual DispatchResult Dispatch(const BoundaryDescriptor& descriptor,
                                    const std::vector<std::string>& command,
                                    const DispatchOptions& options) = 0;

protected:
    // Runs `spec`, stripping the start marker and reporting whether it was seen.
    static ExecResult Launch(const LaunchSpec& spec, const DispatchOptions& options, bool& started);
    // Classifies a sandboxed launch: a non-zero exit before the marker is the
    // launcher failing.
    static DispatchResult Settle(ExecResult exec, bool started, const std::string& launcher);
};

// Removes the first start-marker line from a chunked output stream and
// forwards everything else.
class StartMarkerFilter {
public:
    StartMarkerFilter(std::string marker, ProcessRunner::OutputCallback forward);

    void Feed(const std::string& chunk);
    // Forwards whatever is still held back.
    void Flush();
    bool Seen() const { return seen_; }

private:
    std::string line_;
    ProcessRunner::OutputCallback forward_;
    std::string pending_;
    bool seen_ = false;
};

// Strips the first marker line from complete output; true when it was found.
bool StripStartMarker(std::string& output, const std::string& marker);

class NamespaceBackend : public Backend {
public:
    NamespaceBackend(std::string bwrap_path, std::chrono::seconds probe_timeout);

    BackendKind Kind() const override { return BackendKind::kNamespace; }
    BackendCapabilities Capabilities() const override;
    bool Probe() override;
    DispatchResult Dispatch(const BoundaryDescriptor& descriptor,
                            const std::vector<std::string>& command,
                            const DispatchOptions& options) override;

private:
    std::string bwrap_path_;
    std::string resolved_path_;
    std::chrono::seconds probe_timeout_;
};

class ContainerBackend : public Backend {
public:
    ContainerBackend(std::string docker_path,
                     std::string image,
                     std::chrono::seconds probe_timeout,
                     std::string host_working_directory);

    BackendKind Kind() const override { return BackendKind::kContainer; }
    BackendCapabilities Capabilities() const override;
    bool Probe() override;
    DispatchResult Dispatch(const BoundaryDescriptor& descriptor,
                            const std::vector<std::string>& command,
                            const DispatchOptions& options) override;

private:
    void RemoveContainer(const std::string& name) const;

    std::string docker_path_;
    std::string resolved_path_;
    std::string image_;
    std::chrono::seconds probe_timeout_;
    std::string host_working_directory_;
    bool running_in_container_ = false;
};

// Runs the payload on the host with no isolation. Every dispatch logs a
// warning; Probe() fails when disabled by configuration.
class DirectBackend : public Backend {
public:
    explicit DirectBackend(bool enabled);

    BackendKind Kind() const override { return BackendKind::kDirect; }
    BackendCapabilities Capabilities() const override;
    bool Probe() override;
    DispatchResult Dispatch(const BoundaryDescriptor& descriptor,
                            const std::vector<std::string>& command,
                            const DispatchOptions& options) override;

private:
    bool enabled_;
};

}  // namespace safexec::sandbox
