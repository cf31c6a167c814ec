#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"
#include "session/session_store.hpp"

namespace safexec::sandbox {

class UnsupportedModeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Host path the container engine should mount for `path`, a directory under
// the local workspace `root`. Only differs from `path` when safexec itself runs
// inside a container and the capabilities carry the host directory backing
// `root`. Paths outside `root` fall back to the legacy /WORKSPACE marker.
std::string TranslateVolumePath(const std::string& path,
                                const std::string& root,
                                const BackendCapabilities& capabilities);

// Path mapping between the fixed sandbox root and a host workspace, used when
// no backend provides a real /workspace mount.
std::string MapSandboxToHost(const std::string& sandbox_path, const std::string& host_workspace);
std::string MapHostToSandbox(const std::string& host_path, const std::string& host_workspace);

// Computes the isolation boundary for one subprocess of `request`. Pure apart
// from inspecting which system directories exist on the host. The install
// phase runs outside the workspace and without the session's packages on
// the import path.
BoundaryDescriptor BuildBoundary(const session::Session& session,
                                 const ExecutionRequest& request,
                                 const BackendCapabilities& capabilities);

// Host directory staging one call; its in/ and out/ children are mounted at
// kCallInDir and kCallOutDir.
std::filesystem::path CallDirectory(const session::Session& session, const std::string& call_id);

// Enter the working directory of the boundary or fail the call.
std::string ScriptPrologue(const BoundaryDescriptor& descriptor);

// Renders the process invocation running `command` inside the boundary.
LaunchSpec RenderLaunch(const BoundaryDescriptor& descriptor, const std::vector<std::string>& command);

}  // namespace safexec::sandbox
