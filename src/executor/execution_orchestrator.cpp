#include "executor/execution_orchestrator.hpp"

#include <atomic>
#include <sstream>
#include <unistd.h>

#include "deps/python_imports.hpp"
#include "sandbox/boundary_builder.hpp"
#include "utils/common.hpp"
#include "utils/fs.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace safexec::executor {
namespace {

constexpr int kMaxAttempts = 2;

// Runs the staged script as __main__ and records the final working directory
// on interpreter exit.
constexpr const char* kPythonBootstrap = R"PY(import atexit
import os
import runpy
import sys

_marker, _script = sys.argv[1], sys.argv[2]


def _safexec_record_cwd():
    try:
        with open(_marker, "w") as handle:
            handle.write(os.getcwd())
    except OSError:
        pass


atexit.register(_safexec_record_cwd)
sys.argv = [_script]
sys.path[0] = os.getcwd()
runpy.run_path(_script, run_name="__main__")
)PY";

std::chrono::milliseconds ToMillis(std::chrono::seconds value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value);
}

void Emit(const StreamSink* sink, const std::string& type, const std::string& content,
          nlohmann::json data = nullptr) {
    if (sink && *sink) {
        (*sink)(StreamEvent{type, content, std::move(data)});
    }
}

bool IsForwardedEventType(const std::string& type) {
    return type == "output" || type == "event" || type == "info" || type == "error";
}

void LogInstallFailures(const std::string& output) {
    static const std::string kMarker = "safexec-install-failed: ";
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        const auto pos = line.find(kMarker);
        if (pos != std::string::npos) {
            utils::LogWarn("deps", "install failed", {{"package", utils::Trim(line.substr(pos + kMarker.size()))}});
        }
    }
}

}  // namespace

StagedCall::StagedCall(std::filesystem::path call_dir)
    : call_dir_(std::move(call_dir)) {
    std::error_code ec;
    // a call directory that already exists was not made by this call
    if (!std::filesystem::create_directory(call_dir_, ec)) {
        throw StagingError("cannot create call directory " + call_dir_.string() +
                           (ec ? ": " + ec.message() : std::string(": already exists")));
    }
    for (const auto* child : {"in", "out"}) {
        std::filesystem::create_directory(call_dir_ / child, ec);
        if (!ec) {
            std::filesystem::permissions(call_dir_ / child, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
        }
        if (ec) {
            const auto message = "cannot prepare " + (call_dir_ / child).string() + ": " + ec.message();
            std::filesystem::remove_all(call_dir_, ec);
            throw StagingError(message);
        }
    }
}

StagedCall::~StagedCall() {
    std::error_code ec;
    std::filesystem::remove_all(call_dir_, ec);
    if (ec) {
        utils::LogWarn("exec", "failed to remove call directory", {
            {"path", call_dir_.string()},
            {"error", ec.message()}
        });
    }
}

std::filesystem::path StagedCall::OutPath(const std::string& name) const {
    return call_dir_ / "out" / name;
}

void StagedCall::Write(const std::string& name, const std::string& content) {
    const auto path = call_dir_ / "in" / name;
    if (!utils::WriteNewFile(path, content)) {
        throw StagingError("cannot stage " + path.string());
    }
}

void PumpEventFile(const std::filesystem::path& path, std::size_t& offset, const StreamSink& sink) {
    const auto pending = utils::ReadRegularFile(path, offset);
    if (!pending) {
        return;
    }
    const auto last_newline = pending->rfind('\n');
    if (last_newline == std::string::npos) {
        return;
    }
    offset += last_newline + 1;

    std::istringstream lines(pending->substr(0, last_newline));
    std::string line;
    while (std::getline(lines, line)) {
        line = utils::Trim(line);
        if (line.empty()) {
            continue;
        }
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            sink(StreamEvent{"event", line, nullptr});
            continue;
        }
        std::string type = "event";
        if (parsed.contains("type") && parsed["type"].is_string() &&
            IsForwardedEventType(parsed["type"].get<std::string>())) {
            type = parsed["type"].get<std::string>();
        }
        std::string content;
        if (parsed.contains("content")) {
            content = parsed["content"].is_string() ? parsed["content"].get<std::string>()
                                                    : parsed["content"].dump();
        } else {
            content = line;
        }
        sink(StreamEvent{type, content, std::move(parsed)});
    }
}

ExecutionOrchestrator::ExecutionOrchestrator(session::SessionStore& sessions,
                                             sandbox::BackendSelector& selector,
                                             deps::DependencyResolver resolver,
                                             OrchestratorOptions options)
    : sessions_(sessions)
    , selector_(selector)
    , resolver_(std::move(resolver))
    , options_(std::move(options)) {}

std::string ExecutionOrchestrator::NewCallId() {
    static std::atomic<unsigned long> counter{0};
    const auto seed = std::to_string(::getpid()) + ":" +
                      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ":" +
                      std::to_string(counter.fetch_add(1));
    return utils::Sha256Hex(seed).substr(0, 16);
}

result::ExecutionResult ExecutionOrchestrator::Run(session::Session& session,
                                                   const sandbox::ExecutionRequest& request) {
    return Execute(session, request, nullptr);
}

result::ExecutionResult ExecutionOrchestrator::RunStreaming(session::Session& session,
                                                            const sandbox::ExecutionRequest& request,
                                                            const StreamSink& sink) {
    return Execute(session, request, &sink);
}

sandbox::Backend& ExecutionOrchestrator::BackendFor(session::Session& session) {
    const auto bound = session.Backend();
    if (bound.has_value()) {
        if (auto* backend = selector_.Find(*bound)) {
            return *backend;
        }
        utils::LogInfo("exec", "bound backend unavailable, reselecting", {
            {"session", session.Key().ToString()},
            {"backend", sandbox::ToString(*bound)}
        });
    }
    return selector_.Select();
}

sandbox::DispatchOptions ExecutionOrchestrator::OptionsFor(std::chrono::milliseconds timeout,
                                                           const std::string& start_marker,
                                                           const StreamSink* sink,
                                                           const std::filesystem::path& events_path,
                                                           std::size_t& events_offset) const {
    sandbox::DispatchOptions options{};
    options.timeout = timeout;
    options.start_marker = start_marker;
    if (sink && *sink) {
        options.on_output = [sink](const std::string& chunk) {
            (*sink)(StreamEvent{"output", chunk, nullptr});
        };
        options.on_tick = [sink, events_path, &events_offset]() {
            PumpEventFile(events_path, events_offset, *sink);
        };
        options.tick_interval = options_.event_poll_interval;
    }
    return options;
}

ExecutionOrchestrator::Attempt ExecutionOrchestrator::RunAttempt(session::Session& session,
                                                                 const sandbox::ExecutionRequest& request,
                                                                 sandbox::Backend& backend,
                                                                 const StreamSink* sink) {
    const auto capabilities = backend.Capabilities();
    const auto started = std::chrono::steady_clock::now();
    const auto budget = ToMillis(request.timeout);

    Attempt attempt{};
    auto run_request = request;
    run_request.network = sandbox::NetworkPolicy::kDenied;
    run_request.phase = sandbox::ExecutionPhase::kRun;
    attempt.run_boundary = sandbox::BuildBoundary(session, run_request, capabilities);
    const auto& in_dir = attempt.run_boundary.call_in_dir;
    const auto cwd_file = attempt.run_boundary.call_out_dir + "/cwd";
    const auto packages = attempt.run_boundary.sandbox_root + "/" + sandbox::kPackagesDir;

    // Printed before anything the caller supplied runs.
    const auto start_marker = "__safexec_started_" + NewCallId() + "__";
    const auto announce = "printf '%s\\n' " + utils::ShellQuote(start_marker) + "\n";

    StagedCall staged(sandbox::CallDirectory(session, request.call_id));
    std::string script = announce + sandbox::ScriptPrologue(attempt.run_boundary);
    std::vector<deps::InstallDirective> directives;
    bool install_phase = false;
    sandbox::BoundaryDescriptor install_boundary{};

    if (request.kind == sandbox::RequestKind::kCode) {
        directives = resolver_.Resolve(request.payload);
        install_phase = !directives.empty() && options_.install_network;
        if (install_phase) {
            auto install_request = request;
            install_request.network = sandbox::NetworkPolicy::kAllowed;
            install_request.phase = sandbox::ExecutionPhase::kInstall;
            install_boundary = sandbox::BuildBoundary(session, install_request, capabilities);
            const auto target = install_boundary.sandbox_root + "/" + sandbox::kPackagesDir;
            staged.Write("install.sh", announce + sandbox::ScriptPrologue(install_boundary) + "mkdir -p " +
                                           utils::ShellQuote(target) + "\n" +
                                           deps::RenderInstallScript(directives, options_.python, target));
        } else if (!directives.empty()) {
            script += deps::RenderInstallScript(directives, options_.python, packages);
        }

        staged.Write("code.py", deps::ExtractFencedCode(request.payload));
        staged.Write("boot.py", kPythonBootstrap);
        script += "exec " + utils::ShellQuote(options_.python) + " " + utils::ShellQuote(in_dir + "/boot.py") +
                  " " + utils::ShellQuote(cwd_file) + " " + utils::ShellQuote(in_dir + "/code.py") + "\n";
    } else {
        staged.Write("cmd.sh", request.payload + "\n");
        script += "__safexec_record_cwd() { pwd > " + utils::ShellQuote(cwd_file) + " 2>/dev/null; }\n";
        script += "trap __safexec_record_cwd EXIT\n";
        script += ". " + utils::ShellQuote(in_dir + "/cmd.sh") + "\n";
    }
    staged.Write("run.sh", script);

    if (install_phase) {
        Emit(sink, "info", "Installing " + std::to_string(directives.size()) + " dependency candidate(s)");
        utils::LogInfo("deps", "install phase", {
            {"session", session.Key().ToString()},
            {"directives", std::to_string(directives.size())}
        });
        std::size_t ignored_offset = 0;
        auto install = backend.Dispatch(install_boundary,
                                        {options_.shell, install_boundary.call_in_dir + "/install.sh"},
                                        OptionsFor(budget, start_marker, nullptr, {}, ignored_offset));
        LogInstallFailures(install.exec.output);
        if (install.backend_failed || install.exec.timed_out) {
            attempt.dispatch = std::move(install);
            return attempt;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed >= budget) {
        attempt.dispatch.payload_started = true;
        attempt.dispatch.exec.timed_out = true;
        attempt.dispatch.exec.exit_code = 124;
        return attempt;
    }

    const auto events_path = staged.OutPath("events.jsonl");
    std::size_t events_offset = 0;
    attempt.dispatch = backend.Dispatch(attempt.run_boundary,
                                        {options_.shell, in_dir + "/run.sh"},
                                        OptionsFor(budget - elapsed, start_marker, sink, events_path,
                                                   events_offset));
    if (sink && *sink) {
        PumpEventFile(events_path, events_offset, *sink);
    }

    const auto cwd = utils::ReadRegularFile(staged.OutPath("cwd"), 0, 4096);
    if (cwd) {
        attempt.final_cwd = utils::Trim(*cwd);
    }
    return attempt;
}

void ExecutionOrchestrator::ApplyCwd(session::Session& session, const Attempt& attempt) {
    if (attempt.final_cwd.empty()) {
        return;
    }
    auto path = attempt.final_cwd;
    if (attempt.run_boundary.backend == sandbox::BackendKind::kDirect) {
        path = sandbox::MapHostToSandbox(path, attempt.run_boundary.host_workspace);
    }
    if (path == session.Cwd()) {
        return;
    }
    const auto stored = sessions_.UpdateCwd(session, path);
    utils::LogInfo("session", "cwd updated", {
        {"session", session.Key().ToString()},
        {"cwd", stored}
    });
}

result::ExecutionResult ExecutionOrchestrator::Execute(session::Session& session,
                                                       sandbox::ExecutionRequest request,
                                                       const StreamSink* sink) {
    if (request.call_id.empty()) {
        request.call_id = NewCallId();
    }
    if (request.timeout.count() < 1) {
        request.timeout = std::chrono::seconds(1);
    }
    const auto started = std::chrono::steady_clock::now();

    auto finish = [&](result::ExecutionResult result) {
        if (!result.success) {
            Emit(sink, "error", result.output);
        }
        Emit(sink, "complete", result.success ? "Execution completed" : "Execution failed", {
            {"success", result.success},
            {"exit_code", result.exit_code},
            {"outcome", result::ToString(result.outcome)}
        });
        utils::LogInfo("exec", "finished", {
            {"session", session.Key().ToString()},
            {"call", request.call_id},
            {"outcome", result::ToString(result.outcome)},
            {"exit_code", std::to_string(result.exit_code)},
            {"elapsed_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count())}
        });
        return result;
    };

    sandbox::Backend* backend = nullptr;
    try {
        backend = &BackendFor(session);
    } catch (const sandbox::NoBackendAvailableError& ex) {
        return finish(result::FailureResult(result::Outcome::kEnvironmentError, ex.what()));
    }

    const auto base_call_id = request.call_id;
    for (int attempt_index = 0; attempt_index < kMaxAttempts; ++attempt_index) {
        const auto kind = backend->Kind();
        if (attempt_index > 0) {
            request.call_id = base_call_id + "-r" + std::to_string(attempt_index);
        }
        utils::LogInfo("exec", "dispatch", {
            {"session", session.Key().ToString()},
            {"call", request.call_id},
            {"kind", sandbox::ToString(request.kind)},
            {"backend", backend->Name()}
        });

        Attempt attempt{};
        try {
            attempt = RunAttempt(session, request, *backend, sink);
        } catch (const sandbox::UnsupportedModeError& ex) {
            return finish(result::FailureResult(result::Outcome::kBoundaryError, ex.what()));
        } catch (const StagingError& ex) {
            return finish(result::FailureResult(result::Outcome::kEnvironmentError, ex.what()));
        }

        // once the staged script has started, its exit status belongs to the caller
        if (attempt.dispatch.backend_failed && !attempt.dispatch.payload_started) {
            selector_.ReportFailure(kind);
            const auto reason = attempt.dispatch.failure_reason.empty() ? std::string("unknown failure")
                                                                        : attempt.dispatch.failure_reason;
            auto* next = attempt_index + 1 < kMaxAttempts ? selector_.Next(kind) : nullptr;
            if (next) {
                utils::LogWarn("exec", "backend failed, retrying on next backend", {
                    {"failed", backend->Name()},
                    {"next", next->Name()},
                    {"reason", reason}
                });
                Emit(sink, "info", "Backend " + backend->Name() + " failed, retrying on " + next->Name());
                backend = next;
                continue;
            }
            return finish(result::FailureResult(result::Outcome::kBackendFailure,
                                                "sandbox backend " + backend->Name() + " failed: " + reason));
        }

        selector_.ReportSuccess(kind);
        sessions_.BindBackend(session, kind);
        const auto& exec = attempt.dispatch.exec;
        if (exec.timed_out) {
            utils::LogWarn("exec", "timed out", {
                {"session", session.Key().ToString()},
                {"timeout_s", std::to_string(request.timeout.count())}
            });
            return finish(result::TimeoutResult(exec.output, static_cast<int>(request.timeout.count())));
        }
        auto classified = result::Classify(exec.exit_code, exec.output);
        if (classified.success) {
            ApplyCwd(session, attempt);
        }
        return finish(std::move(classified));
    }
    return finish(result::FailureResult(result::Outcome::kBackendFailure, "no sandbox backend could run the call"));
}

}  // namespace safexec::executor
