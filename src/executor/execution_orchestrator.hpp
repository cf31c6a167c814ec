#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "deps/dependency_resolver.hpp"
#include "nlohmann/json.hpp"
#include "result/result_classifier.hpp"
#include "sandbox/backend_selector.hpp"
#include "session/session_store.hpp"

namespace safexec::executor {

class StagingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One item on the streaming channel. `type` is one of output, event, info,
// error or complete.
struct StreamEvent {
    std::string type;
    std::string content;
    nlohmann::json data;
};

using StreamSink = std::function<void(const StreamEvent&)>;

struct OrchestratorOptions {
    std::string python = "python3";
    std::string shell = "/bin/bash";
    // Run the install phase in its own subprocess with network enabled. When
    // false, installs are attempted inside the network-less run phase.
    bool install_network = true;
    std::chrono::milliseconds event_poll_interval{500};
};

// Host directory of one call. in/ holds the staged scripts and is mounted
// read-only; out/ collects what the sandbox reports back. The whole directory
// is removed on destruction.
class StagedCall {
public:
    explicit StagedCall(std::filesystem::path call_dir);
    ~StagedCall();

    StagedCall(const StagedCall&) = delete;
    StagedCall& operator=(const StagedCall&) = delete;

    // Creates in/<name> with owner-only permissions.
    void Write(const std::string& name, const std::string& content);
    std::filesystem::path OutPath(const std::string& name) const;

private:
    std::filesystem::path call_dir_;
};

class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(session::SessionStore& sessions,
                          sandbox::BackendSelector& selector,
                          deps::DependencyResolver resolver,
                          OrchestratorOptions options);

    result::ExecutionResult Run(session::Session& session, const sandbox::ExecutionRequest& request);
    result::ExecutionResult RunStreaming(session::Session& session,
                                         const sandbox::ExecutionRequest& request,
                                         const StreamSink& sink);

    static std::string NewCallId();

private:
    struct Attempt {
        sandbox::DispatchResult dispatch;
        sandbox::BoundaryDescriptor run_boundary;
        std::string final_cwd;
    };

    result::ExecutionResult Execute(session::Session& session,
                                    sandbox::ExecutionRequest request,
                                    const StreamSink* sink);
    sandbox::Backend& BackendFor(session::Session& session);
    Attempt RunAttempt(session::Session& session,
                       const sandbox::ExecutionRequest& request,
                       sandbox::Backend& backend,
                       const StreamSink* sink);
    sandbox::DispatchOptions OptionsFor(std::chrono::milliseconds timeout,
                                        const std::string& start_marker,
                                        const StreamSink* sink,
                                        const std::filesystem::path& events_path,
                                        std::size_t& events_offset) const;
    void ApplyCwd(session::Session& session, const Attempt& attempt);

    session::SessionStore& sessions_;
    sandbox::BackendSelector& selector_;
    deps::DependencyResolver resolver_;
    OrchestratorOptions options_;
};

// Forwards lines appended to `path` since `offset` as stream events. JSON
// objects keep their "type"/"content"; anything else arrives as plain text.
void PumpEventFile(const std::filesystem::path& path, std::size_t& offset, const StreamSink& sink);

}  // namespace safexec::executor
