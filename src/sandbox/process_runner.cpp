#include "sandbox/process_runner.hpp"

#if __has_include(<boost/process/v1.hpp>)
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace safexec::sandbox {
#if __has_include(<boost/process/v1.hpp>)
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr auto kWaitInterval = std::chrono::milliseconds(50);
constexpr auto kTerminateGrace = std::chrono::seconds(2);
constexpr auto kDrainTimeout = std::chrono::milliseconds(200);

enum class WaitState {
    kRunning,
    kExited,
    kLost
};

WaitState TryReap(pid_t pid, int& status) {
    const auto waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
        return WaitState::kExited;
    }
    if (waited < 0) {
        return WaitState::kLost;
    }
    return WaitState::kRunning;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// SIGTERM the group, give it a grace period, then SIGKILL whatever is left.
void TerminateGroup(bp::group& group, pid_t pid, int& status) {
    ::killpg(group.native_handle(), SIGTERM);
    bool reaped = false;
    const auto grace_deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        const auto state = TryReap(pid, status);
        if (state != WaitState::kRunning) {
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::error_code ec;
    group.terminate(ec);
    if (!reaped) {
        ::waitpid(pid, &status, 0);
    }
}

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    return bp::search_path(name).string();
}

bp::environment BuildEnvironment(const LaunchSpec& spec) {
    bp::environment env;
    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }
    return env;
}

std::string NewCaptureStamp() {
    static std::atomic<unsigned long> counter{0};
    return std::to_string(::getpid()) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
           std::to_string(counter.fetch_add(1));
}

}  // namespace

std::string ProcessRunner::FindExecutable(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        return std::filesystem::exists(name, ec) ? name : std::string();
    }
    return bp::search_path(name).string();
}

ExecResult ProcessRunner::Run(const LaunchSpec& spec, std::chrono::milliseconds timeout) {
    ExecResult result{};
    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.output = "Error: empty command";
        return result;
    }
    const auto executable = ResolveExecutable(spec.argv.front());
    if (executable.empty()) {
        result.spawn_failed = true;
        result.output = "Error: executable not found: " + spec.argv.front();
        return result;
    }
    const std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());

    const auto capture_path = std::filesystem::temp_directory_path() /
                              ("safexec_output_" + NewCaptureStamp() + ".log");
    const auto start_dir = spec.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec.working_dir;

    try {
        bp::group group;
        bp::child child_process = spec.clear_env
            ? bp::child(
                  bp::exe = executable,
                  bp::args = args,
                  BuildEnvironment(spec),
                  bp::start_dir = start_dir,
                  bp::std_in < bp::null,
                  (bp::std_out & bp::std_err) > capture_path.string(),
                  group)
            : bp::child(
                  bp::exe = executable,
                  bp::args = args,
                  bp::start_dir = start_dir,
                  bp::std_in < bp::null,
                  (bp::std_out & bp::std_err) > capture_path.string(),
                  group);

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (std::chrono::steady_clock::now() < deadline) {
            const auto state = TryReap(pid, status);
            if (state == WaitState::kExited) {
                finished = true;
                break;
            }
            if (state == WaitState::kLost) {
                break;
            }
            std::this_thread::sleep_for(kWaitInterval);
        }
        if (finished) {
            result.exit_code = DecodeStatus(status);
            // background leftovers do not outlive the call
            std::error_code ec;
            group.terminate(ec);
        } else {
            result.timed_out = true;
            TerminateGroup(group, pid, status);
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.spawn_failed = true;
        result.exit_code = -1;
        result.output = std::string("Error: exec failed: ") + ex.what();
        std::error_code ec;
        std::filesystem::remove(capture_path, ec);
        return result;
    }

    std::ostringstream output_stream;
    {
        std::ifstream input(capture_path);
        if (input.is_open()) {
            output_stream << input.rdbuf();
        }
    }
    result.output = output_stream.str();

    std::error_code ec;
    std::filesystem::remove(capture_path, ec);
    return result;
}

ExecResult ProcessRunner::RunStreaming(const LaunchSpec& spec,
                                       std::chrono::milliseconds timeout,
                                       const OutputCallback& on_output,
                                       const TickCallback& on_tick,
                                       std::chrono::milliseconds tick_interval) {
    ExecResult result{};
    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.output = "Error: empty command";
        return result;
    }
    const auto executable = ResolveExecutable(spec.argv.front());
    if (executable.empty()) {
        result.spawn_failed = true;
        result.output = "Error: executable not found: " + spec.argv.front();
        return result;
    }
    const std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());
    const auto start_dir = spec.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec.working_dir;

    auto forward = [&](const char* data, std::size_t size) {
        std::string chunk(data, size);
        result.output += chunk;
        if (on_output) {
            on_output(chunk);
        }
    };

    try {
        bp::pipe output_pipe;
        bp::group group;
        bp::child child_process = spec.clear_env
            ? bp::child(
                  bp::exe = executable,
                  bp::args = args,
                  BuildEnvironment(spec),
                  bp::start_dir = start_dir,
                  bp::std_in < bp::null,
                  (bp::std_out & bp::std_err) > output_pipe,
                  group)
            : bp::child(
                  bp::exe = executable,
                  bp::args = args,
                  bp::start_dir = start_dir,
                  bp::std_in < bp::null,
                  (bp::std_out & bp::std_err) > output_pipe,
                  group);

        const int fd = output_pipe.native_source();
        const pid_t pid = child_process.id();
        const auto started = std::chrono::steady_clock::now();
        const auto deadline = started + timeout;
        auto next_tick = started + tick_interval;
        bool finished = false;
        bool eof = false;
        int status = 0;
        char buffer[4096];

        while (std::chrono::steady_clock::now() < deadline) {
            if (!eof) {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLIN;
                const int ready = ::poll(&pfd, 1, static_cast<int>(kWaitInterval.count()));
                if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
                    const auto count = ::read(fd, buffer, sizeof(buffer));
                    if (count > 0) {
                        forward(buffer, static_cast<std::size_t>(count));
                    } else if (count == 0) {
                        eof = true;
                    }
                }
            } else {
                std::this_thread::sleep_for(kWaitInterval);
            }

            const auto now = std::chrono::steady_clock::now();
            if (on_tick && now >= next_tick) {
                on_tick();
                next_tick = now + tick_interval;
            }

            const auto state = TryReap(pid, status);
            if (state == WaitState::kExited) {
                finished = true;
                break;
            }
            if (state == WaitState::kLost) {
                break;
            }
        }

        if (finished) {
            result.exit_code = DecodeStatus(status);
            // pick up whatever the child wrote just before exiting
            const auto drain_deadline = std::chrono::steady_clock::now() + kDrainTimeout;
            while (!eof && std::chrono::steady_clock::now() < drain_deadline) {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLIN;
                if (::poll(&pfd, 1, static_cast<int>(kDrainTimeout.count())) <= 0) {
                    break;
                }
                const auto count = ::read(fd, buffer, sizeof(buffer));
                if (count <= 0) {
                    eof = true;
                } else {
                    forward(buffer, static_cast<std::size_t>(count));
                }
            }
            std::error_code ec;
            group.terminate(ec);
        } else {
            result.timed_out = true;
            TerminateGroup(group, pid, status);
            result.exit_code = 124;
        }
        if (on_tick) {
            on_tick();
        }
    } catch (const bp::process_error& ex) {
        result.spawn_failed = true;
        result.exit_code = -1;
        result.output = std::string("Error: exec failed: ") + ex.what();
    }
    return result;
}

}  // namespace safexec::sandbox
