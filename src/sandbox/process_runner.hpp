#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "sandbox/sandbox_types.hpp"

namespace safexec::sandbox {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    // The launcher itself could not be started (missing binary, bad cwd).
    bool spawn_failed = false;
    // Combined stdout and stderr in arrival order.
    std::string output;
};

class ProcessRunner {
public:
    using OutputCallback = std::function<void(const std::string&)>;
    using TickCallback = std::function<void()>;

    // Runs to completion or until `timeout`, then kills the whole process group.
    static ExecResult Run(const LaunchSpec& spec, std::chrono::milliseconds timeout);

    // Same contract as Run, but output chunks are handed to `on_output` as they
    // arrive and `on_tick` fires every `tick_interval` while the child lives.
    static ExecResult RunStreaming(const LaunchSpec& spec,
                                   std::chrono::milliseconds timeout,
                                   const OutputCallback& on_output,
                                   const TickCallback& on_tick,
                                   std::chrono::milliseconds tick_interval);

    // Absolute path of `name` (searched on PATH unless it contains a slash),
    // or an empty string.
    static std::string FindExecutable(const std::string& name);
};

}  // namespace safexec::sandbox
