#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <unistd.h>

#include "sandbox/backend.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/logging.hpp"

namespace safexec::testing {

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("safexec_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Collects every log message emitted while alive.
class LogCapture {
public:
    LogCapture() {
        id_ = utils::Logger::Instance().AddSink([this](const utils::LogMessage& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        });
    }

    ~LogCapture() { utils::Logger::Instance().RemoveSink(id_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool Contains(utils::LogLevel level, const std::string& tag, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& message : messages_) {
            if (message.level == level && message.tag == tag &&
                message.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    int id_ = 0;
    std::vector<utils::LogMessage> messages_;
    mutable std::mutex mutex_;
};

inline bool HaveBinary(const std::string& name) {
    return !sandbox::ProcessRunner::FindExecutable(name).empty();
}

// Writes an executable shell script standing in for a launcher binary.
inline std::filesystem::path WriteScript(const std::filesystem::path& path, const std::string& body) {
    {
        std::ofstream output(path, std::ios::trunc);
        output << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

// Scriptable backend for selector and orchestrator tests.
class FakeBackend : public sandbox::Backend {
public:
    FakeBackend(sandbox::BackendKind kind, bool available)
        : kind_(kind)
        , available_(available) {}

    sandbox::BackendKind Kind() const override { return kind_; }

    sandbox::BackendCapabilities Capabilities() const override {
        sandbox::BackendCapabilities capabilities{};
        capabilities.kind = kind_;
        capabilities.binary = "fake";
        capabilities.supports_shell = supports_shell;
        capabilities.supports_code = supports_code;
        return capabilities;
    }

    bool Probe() override {
        ++probe_count;
        return available_;
    }

    sandbox::DispatchResult Dispatch(const sandbox::BoundaryDescriptor& descriptor,
                                     const std::vector<std::string>& command,
                                     const sandbox::DispatchOptions&) override {
        ++dispatch_count;
        descriptors.push_back(descriptor);
        commands.push_back(command);
        sandbox::DispatchResult result{};
        if (fail_dispatch) {
            // a failure reported after the script started must not be retried
            result.payload_started = fail_after_start;
            result.backend_failed = true;
            result.failure_reason = "fake backend broken";
            result.exec.exit_code = 1;
            return result;
        }
        result.payload_started = true;
        result.exec.exit_code = 0;
        result.exec.output = canned_output;
        return result;
    }

    bool supports_shell = true;
    bool supports_code = true;
    bool fail_dispatch = false;
    bool fail_after_start = false;
    std::string canned_output = "fake output\n";
    int probe_count = 0;
    int dispatch_count = 0;
    std::vector<sandbox::BoundaryDescriptor> descriptors;
    std::vector<std::vector<std::string>> commands;

private:
    sandbox::BackendKind kind_;
    bool available_;
};

}  // namespace safexec::testing
