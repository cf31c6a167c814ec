#include <gtest/gtest.h>

#include <algorithm>

#include "sandbox/boundary_builder.hpp"
#include "session/session_store.hpp"
#include "test_support.hpp"

namespace safexec::sandbox {
namespace {

bool HasArg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

// True when `sequence` appears contiguously in `argv`.
bool HasSequence(const std::vector<std::string>& argv, const std::vector<std::string>& sequence) {
    return std::search(argv.begin(), argv.end(), sequence.begin(), sequence.end()) != argv.end();
}

std::string EnvValue(const BoundaryDescriptor& descriptor, const std::string& key) {
    for (const auto& [name, value] : descriptor.env) {
        if (name == key) {
            return value;
        }
    }
    return "";
}

BackendCapabilities NamespaceCapabilities() {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kNamespace;
    capabilities.binary = "/usr/bin/bwrap";
    return capabilities;
}

BackendCapabilities ContainerCapabilities() {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kContainer;
    capabilities.binary = "docker";
    capabilities.image = "joshxt/safeexecute:latest";
    capabilities.container_user = "1000:1000";
    return capabilities;
}

ExecutionRequest RunRequest(RequestKind kind = RequestKind::kCode) {
    ExecutionRequest request{};
    request.kind = kind;
    request.payload = "print(1)";
    request.call_id = "abc123";
    return request;
}

class BoundaryBuilderTest : public ::testing::Test {
protected:
    BoundaryBuilderTest()
        : store_(temp_.Path()) {
        session_ = store_.GetOrCreate("agent", "conversation");
    }

    testing::TempDir temp_;
    session::SessionStore store_;
    std::shared_ptr<session::Session> session_;
};

TEST_F(BoundaryBuilderTest, NamespaceRunPhaseIsolatesEverything) {
    const auto descriptor = BuildBoundary(*session_, RunRequest(), NamespaceCapabilities());
    EXPECT_FALSE(descriptor.NetworkEnabled());
    EXPECT_TRUE(descriptor.unshare_pid);
    EXPECT_TRUE(descriptor.unshare_ipc);
    EXPECT_TRUE(descriptor.unshare_uts);

    const auto spec = RenderLaunch(descriptor, {"/bin/bash", "/run/safexec/in/run.sh"});
    const auto& argv = spec.argv;
    ASSERT_FALSE(argv.empty());
    EXPECT_EQ(argv.front(), "/usr/bin/bwrap");
    for (const auto& flag : {"--die-with-parent", "--unshare-pid", "--unshare-ipc", "--unshare-uts",
                             "--unshare-net", "--clearenv"}) {
        EXPECT_TRUE(HasArg(argv, flag)) << flag;
    }
    const auto call_dir = CallDirectory(*session_, "abc123");
    EXPECT_TRUE(HasSequence(argv, {"--bind", session_->Workspace().string(), "/workspace"}));
    EXPECT_TRUE(HasSequence(argv, {"--ro-bind", (call_dir / "in").string(), "/run/safexec/in"}));
    EXPECT_TRUE(HasSequence(argv, {"--bind", (call_dir / "out").string(), "/run/safexec/out"}));
    EXPECT_TRUE(HasSequence(argv, {"--ro-bind", "/usr", "/usr"}));
    EXPECT_TRUE(HasSequence(argv, {"--tmpfs", "/tmp"}));
    EXPECT_TRUE(HasSequence(argv, {"--setenv", "HOME", "/workspace"}));
    EXPECT_TRUE(HasSequence(argv, {"--chdir", "/workspace", "--", "/bin/bash"}));
    EXPECT_EQ(argv.back(), "/run/safexec/in/run.sh");
    EXPECT_EQ(std::count(argv.begin(), argv.end(), "--bind"), 2);
}

TEST_F(BoundaryBuilderTest, OnlyTheWorkspaceAndCallOutputAreWritable) {
    const auto descriptor = BuildBoundary(*session_, RunRequest(), NamespaceCapabilities());
    std::vector<std::string> writable;
    for (const auto& mount : descriptor.mounts) {
        if (!mount.read_only && !mount.symlink) {
            writable.push_back(mount.sandbox_path);
        }
    }
    EXPECT_EQ(writable, (std::vector<std::string>{"/workspace", "/run/safexec/out"}));
}

TEST_F(BoundaryBuilderTest, SessionRecordAndStateStayOutsideTheMounts) {
    for (const auto& capabilities : {NamespaceCapabilities(), ContainerCapabilities()}) {
        const auto descriptor = BuildBoundary(*session_, RunRequest(), capabilities);
        for (const auto& mount : descriptor.mounts) {
            if (mount.sandbox_path == "/workspace") {
                EXPECT_EQ(mount.host_path, session_->Workspace().string());
            }
            EXPECT_NE(mount.host_path, session_->Directory().string());
            EXPECT_NE(mount.host_path, session_->StateDir().string());
        }
    }
}

TEST_F(BoundaryBuilderTest, RunPhaseNeverEnablesNetworkEvenWhenInstallDoes) {
    auto install_request = RunRequest();
    install_request.network = NetworkPolicy::kAllowed;
    install_request.phase = ExecutionPhase::kInstall;
    const auto install = BuildBoundary(*session_, install_request, NamespaceCapabilities());
    EXPECT_TRUE(install.NetworkEnabled());
    EXPECT_FALSE(HasArg(RenderLaunch(install, {"true"}).argv, "--unshare-net"));

    for (const auto& capabilities : {NamespaceCapabilities(), ContainerCapabilities()}) {
        const auto run = BuildBoundary(*session_, RunRequest(), capabilities);
        EXPECT_FALSE(run.NetworkEnabled());
        const auto argv = RenderLaunch(run, {"true"}).argv;
        EXPECT_FALSE(HasSequence(argv, {"--network", "bridge"}));
        EXPECT_FALSE(HasSequence(argv, {"--network", "host"}));
    }
}

TEST_F(BoundaryBuilderTest, ContainerMountsWorkspaceAndDisablesNetwork) {
    const auto descriptor = BuildBoundary(*session_, RunRequest(), ContainerCapabilities());
    EXPECT_EQ(descriptor.container_name, "safexec-abc123");
    const auto argv = RenderLaunch(descriptor, {"/bin/bash", "script.sh"}).argv;
    EXPECT_TRUE(HasSequence(argv, {"docker", "run", "--rm"}));
    EXPECT_TRUE(HasSequence(argv, {"--network", "none"}));
    EXPECT_TRUE(HasSequence(argv, {"--name", "safexec-abc123"}));
    EXPECT_TRUE(HasSequence(argv, {"--user", "1000:1000"}));
    const auto call_dir = CallDirectory(*session_, "abc123");
    EXPECT_TRUE(HasSequence(argv, {"-v", session_->Workspace().string() + ":/workspace:rw"}));
    EXPECT_TRUE(HasSequence(argv, {"-v", (call_dir / "in").string() + ":/run/safexec/in:ro"}));
    EXPECT_TRUE(HasSequence(argv, {"-v", (call_dir / "out").string() + ":/run/safexec/out:rw"}));
    EXPECT_TRUE(HasSequence(argv, {"joshxt/safeexecute:latest", "/bin/bash", "script.sh"}));
}

TEST_F(BoundaryBuilderTest, ContainerNetworkFollowsThePhase) {
    auto install_request = RunRequest();
    install_request.network = NetworkPolicy::kAllowed;
    install_request.phase = ExecutionPhase::kInstall;
    const auto install = BuildBoundary(*session_, install_request, ContainerCapabilities());
    const auto install_argv = RenderLaunch(install, {"/bin/bash", "/run/safexec/in/install.sh"}).argv;
    EXPECT_TRUE(HasSequence(install_argv, {"--network", "bridge"}));
    EXPECT_FALSE(HasSequence(install_argv, {"--network", "none"}));
    EXPECT_TRUE(HasSequence(install_argv, {"--name", "safexec-abc123-install"}));

    const auto run = BuildBoundary(*session_, RunRequest(), ContainerCapabilities());
    const auto run_argv = RenderLaunch(run, {"/bin/bash", "/run/safexec/in/run.sh"}).argv;
    EXPECT_TRUE(HasSequence(run_argv, {"--network", "none"}));
    EXPECT_FALSE(HasSequence(run_argv, {"--network", "bridge"}));
    EXPECT_TRUE(HasSequence(run_argv, {"--name", "safexec-abc123"}));
}

TEST_F(BoundaryBuilderTest, EnvironmentPointsIntoTheSandbox) {
    const auto descriptor = BuildBoundary(*session_, RunRequest(), NamespaceCapabilities());
    EXPECT_EQ(EnvValue(descriptor, "HOME"), "/workspace");
    EXPECT_EQ(EnvValue(descriptor, "PYTHONPATH"), "/workspace/.safexec/site-packages");
    EXPECT_EQ(EnvValue(descriptor, "SAFEXEC_EVENTS_FILE"), "/run/safexec/out/events.jsonl");
    EXPECT_FALSE(EnvValue(descriptor, "PATH").empty());
}

TEST_F(BoundaryBuilderTest, InstallPhaseRunsOutsideTheWorkspace) {
    auto request = RunRequest();
    request.network = NetworkPolicy::kAllowed;
    request.phase = ExecutionPhase::kInstall;
    const auto descriptor = BuildBoundary(*session_, request, NamespaceCapabilities());
    EXPECT_EQ(descriptor.working_dir, "/tmp");
    EXPECT_EQ(ScriptPrologue(descriptor), "cd -- '/tmp' || exit 1\n");
    EXPECT_EQ(EnvValue(descriptor, "HOME"), "/tmp");
    EXPECT_EQ(EnvValue(descriptor, "PIP_CONFIG_FILE"), "/dev/null");
    for (const auto& [name, value] : descriptor.env) {
        EXPECT_NE(name, "PYTHONPATH") << value;
    }
}

TEST_F(BoundaryBuilderTest, WorkingDirectoryComesFromTheSession) {
    store_.UpdateCwd(*session_, "data/raw");
    const auto descriptor = BuildBoundary(*session_, RunRequest(), NamespaceCapabilities());
    EXPECT_EQ(descriptor.working_dir, "/workspace/data/raw");
    EXPECT_EQ(ScriptPrologue(descriptor), "cd -- '/workspace/data/raw' || exit 1\n");
}

TEST_F(BoundaryBuilderTest, DirectBackendRewritesPathsOntoTheHost) {
    store_.UpdateCwd(*session_, "sub");
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kDirect;
    capabilities.network_control = false;
    const auto descriptor = BuildBoundary(*session_, RunRequest(), capabilities);
    const auto workspace = session_->Workspace().string();
    EXPECT_EQ(descriptor.sandbox_root, workspace);
    EXPECT_EQ(descriptor.working_dir, workspace + "/sub");
    EXPECT_EQ(EnvValue(descriptor, "HOME"), workspace);
    const auto call_dir = CallDirectory(*session_, "abc123");
    EXPECT_EQ(descriptor.call_in_dir, (call_dir / "in").string());
    EXPECT_EQ(EnvValue(descriptor, "SAFEXEC_EVENTS_FILE"), (call_dir / "out" / "events.jsonl").string());

    const auto spec = RenderLaunch(descriptor, {"/bin/sh", "-c", "true"});
    EXPECT_TRUE(spec.clear_env);
    EXPECT_EQ(spec.working_dir, workspace);
    EXPECT_EQ(spec.argv, (std::vector<std::string>{"/bin/sh", "-c", "true"}));
}

TEST_F(BoundaryBuilderTest, UnsupportedModesThrow) {
    auto capabilities = NamespaceCapabilities();
    capabilities.supports_shell = false;
    EXPECT_THROW(BuildBoundary(*session_, RunRequest(RequestKind::kShell), capabilities), UnsupportedModeError);
    EXPECT_NO_THROW(BuildBoundary(*session_, RunRequest(RequestKind::kCode), capabilities));

    capabilities.supports_shell = true;
    capabilities.supports_code = false;
    EXPECT_THROW(BuildBoundary(*session_, RunRequest(RequestKind::kCode), capabilities), UnsupportedModeError);
}

TEST(BoundaryPathTest, TranslatesVolumePathForDockerInDocker) {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kContainer;
    const std::string root = "/app/WORKSPACE";
    EXPECT_EQ(TranslateVolumePath("/app/WORKSPACE/abc/workspace", root, capabilities),
              "/app/WORKSPACE/abc/workspace");

    capabilities.running_in_container = true;
    EXPECT_EQ(TranslateVolumePath("/app/WORKSPACE/abc/workspace", root, capabilities),
              "/app/WORKSPACE/abc/workspace");

    capabilities.host_working_directory = "/srv/agent/WORKSPACE/";
    EXPECT_EQ(TranslateVolumePath("/app/WORKSPACE/abc/workspace", root, capabilities),
              "/srv/agent/WORKSPACE/abc/workspace");
    EXPECT_EQ(TranslateVolumePath("/app/WORKSPACE", root, capabilities), "/srv/agent/WORKSPACE");
}

TEST(BoundaryPathTest, TranslationKeepsSessionsApart) {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kContainer;
    capabilities.running_in_container = true;
    capabilities.host_working_directory = "/srv/agent/data";
    const std::string root = "/data/sessions";
    const auto first = TranslateVolumePath("/data/sessions/aaa/workspace", root, capabilities);
    const auto second = TranslateVolumePath("/data/sessions/bbb/workspace", root, capabilities);
    EXPECT_EQ(first, "/srv/agent/data/aaa/workspace");
    EXPECT_EQ(second, "/srv/agent/data/bbb/workspace");
    EXPECT_NE(first, second);
    // a sibling that merely shares the prefix is not under the root
    EXPECT_EQ(TranslateVolumePath("/data/sessions2/x", root, capabilities), "/data/sessions2/x");
}

TEST(BoundaryPathTest, LegacyWorkspaceMarkerStillTranslates) {
    BackendCapabilities capabilities{};
    capabilities.kind = BackendKind::kContainer;
    capabilities.running_in_container = true;
    capabilities.host_working_directory = "/srv/agent/WORKSPACE";
    EXPECT_EQ(TranslateVolumePath("/opt/WORKSPACE/abc/workspace", "/data/sessions", capabilities),
              "/srv/agent/WORKSPACE/abc/workspace");
    EXPECT_EQ(TranslateVolumePath("/elsewhere/abc", "/data/sessions", capabilities), "/elsewhere/abc");
}

TEST(BoundaryPathTest, MapsBetweenSandboxAndHost) {
    EXPECT_EQ(MapSandboxToHost("/workspace", "/h/ws"), "/h/ws");
    EXPECT_EQ(MapSandboxToHost("/workspace/a/b", "/h/ws"), "/h/ws/a/b");
    EXPECT_EQ(MapSandboxToHost("/workspacex", "/h/ws"), "/workspacex");
    EXPECT_EQ(MapHostToSandbox("/h/ws/a", "/h/ws"), "/workspace/a");
    EXPECT_EQ(MapHostToSandbox("/h/ws", "/h/ws"), "/workspace");
    EXPECT_EQ(MapHostToSandbox("/tmp", "/h/ws"), "/tmp");
}

}  // namespace
}  // namespace safexec::sandbox
