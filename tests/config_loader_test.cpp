#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "config/config_loader.hpp"
#include "test_support.hpp"

namespace safexec::config {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value)
        : name_(name) {
        const char* previous = std::getenv(name);
        if (previous) {
            previous_ = previous;
            had_previous_ = true;
        }
        ::setenv(name, value, 1);
    }

    ~ScopedEnv() {
        if (had_previous_) {
            ::setenv(name_.c_str(), previous_.c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string previous_;
    bool had_previous_ = false;
};

TEST(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
    const Config config{};
    EXPECT_EQ(config.sandbox.order, (std::vector<std::string>{"namespace", "container", "direct"}));
    EXPECT_TRUE(config.sandbox.allow_direct);
    EXPECT_EQ(config.sandbox.image, "joshxt/safeexecute:latest");
    EXPECT_EQ(config.execution.timeout_s, 300);
    EXPECT_EQ(config.sandbox.failure_threshold, 2);
}

TEST(ConfigLoaderTest, JsonOverridesDefaults) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "workspace": {"root": "/srv/ws"},
        "sandbox": {"order": ["container", "direct"], "allowDirect": false, "image": "custom:1"},
        "execution": {"timeoutS": 30, "installNetwork": false},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.workspace.root, "/srv/ws");
    EXPECT_EQ(config.sandbox.order, (std::vector<std::string>{"container", "direct"}));
    EXPECT_FALSE(config.sandbox.allow_direct);
    EXPECT_EQ(config.sandbox.image, "custom:1");
    EXPECT_EQ(config.execution.timeout_s, 30);
    EXPECT_FALSE(config.execution.install_network);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigLoaderTest, WrongTypesAreIgnored) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"execution": {"timeoutS": "soon"}, "sandbox": 3})"));
    EXPECT_EQ(config.execution.timeout_s, 300);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    testing::TempDir temp;
    const auto path = temp.Path() / "config.json";
    {
        std::ofstream output(path);
        output << R"({"execution": {"timeoutS": 30}, "sandbox": {"order": ["namespace"]}})";
    }
    ScopedEnv timeout("SAFEXEC_EXECUTION__TIMEOUT_S", "45");
    ScopedEnv order("SAFEXEC_SANDBOX_ORDER", "direct, container");
    ScopedEnv allow("SAFEXEC_SANDBOX__ALLOW_DIRECT", "no");
    ScopedEnv host("WORKING_DIRECTORY", "/host/WORKSPACE");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.execution.timeout_s, 45);
    EXPECT_EQ(config.sandbox.order, (std::vector<std::string>{"direct", "container"}));
    EXPECT_FALSE(config.sandbox.allow_direct);
    EXPECT_EQ(config.workspace.host_working_directory, "/host/WORKSPACE");
}

TEST(ConfigLoaderTest, UnreadableFileKeepsDefaults) {
    testing::TempDir temp;
    const auto path = temp.Path() / "config.json";
    {
        std::ofstream output(path);
        output << "{ broken";
    }
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.image, "joshxt/safeexecute:latest");
}

TEST(ConfigLoaderTest, ExpandsHome) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(ExpandHome("~/.safexec/workspaces"), std::filesystem::path("/home/tester/.safexec/workspaces"));
    EXPECT_EQ(ExpandHome("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(ExpandHome("/abs"), std::filesystem::path("/abs"));
}

}  // namespace
}  // namespace safexec::config
