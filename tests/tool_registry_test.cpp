#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "tools/exec_tools.hpp"
#include "tools/tool_registry.hpp"
#include "utils/common.hpp"
#include "test_support.hpp"

namespace safexec::tools {
namespace {

class EchoTool : public Tool {
public:
    explicit EchoTool(std::string name)
        : name_(std::move(name)) {}

    std::string Name() const override { return name_; }
    std::string Description() const override { return "echoes its text"; }
    std::string ParametersJson() const override { return R"({"type":"object"})"; }
    std::string Execute(const ToolParams& params) override {
        auto it = params.find("text");
        return it == params.end() ? "" : it->second;
    }

private:
    std::string name_;
};

TEST(ToolRegistryTest, DispatchesByName) {
    ToolRegistry registry;
    registry.Register(std::make_unique<EchoTool>("echo"));
    EXPECT_TRUE(registry.Has("echo"));
    EXPECT_NE(registry.Get("echo"), nullptr);
    EXPECT_EQ(registry.Execute("echo", {{"text", "hi"}}), "hi");
}

TEST(ToolRegistryTest, UnknownToolIsAnError) {
    ToolRegistry registry;
    EXPECT_FALSE(registry.Has("nope"));
    EXPECT_EQ(registry.Get("nope"), nullptr);
    EXPECT_EQ(registry.Execute("nope", {}), "Error: Tool 'nope' not found");
}

TEST(ToolRegistryTest, DefinitionsAreSortedByName) {
    ToolRegistry registry;
    registry.Register(std::make_unique<EchoTool>("zeta"));
    registry.Register(std::make_unique<EchoTool>("alpha"));
    const auto definitions = registry.GetDefinitions();
    ASSERT_EQ(definitions.size(), 2u);
    EXPECT_EQ(definitions[0].name, "alpha");
    EXPECT_EQ(definitions[1].name, "zeta");
    EXPECT_EQ(definitions[0].description, "echoes its text");
    EXPECT_EQ(registry.List(), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST(ToolRegistryTest, ParsesTimeoutParameter) {
    EXPECT_FALSE(ParseTimeoutParam({}).has_value());
    EXPECT_FALSE(ParseTimeoutParam({{"timeout", ""}}).has_value());
    EXPECT_FALSE(ParseTimeoutParam({{"timeout", "soon"}}).has_value());
    EXPECT_FALSE(ParseTimeoutParam({{"timeout", "0"}}).has_value());
    ASSERT_TRUE(ParseTimeoutParam({{"timeout", "30"}}).has_value());
    EXPECT_EQ(*ParseTimeoutParam({{"timeout", "30"}}), std::chrono::seconds(30));
}

class ExecToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config::Config config{};
        config.workspace.root = temp_.Path().string();
        config.sandbox.order = {"direct"};
        service_ = std::make_unique<service::SandboxService>(config);
        registry_.Register(std::make_unique<ExecTool>(*service_, session::SessionKey{"agent", "tools"}));
        registry_.Register(std::make_unique<PythonTool>(*service_, session::SessionKey{"agent", "tools"}));
    }

    testing::TempDir temp_;
    std::unique_ptr<service::SandboxService> service_;
    ToolRegistry registry_;
};

TEST_F(ExecToolsTest, MissingParametersAreReported) {
    EXPECT_EQ(registry_.Execute("exec", {}), "Error: missing command");
    EXPECT_EQ(registry_.Execute("python", {{"code", ""}}), "Error: missing code");
    EXPECT_EQ(registry_.List(), (std::vector<std::string>{"exec", "python"}));
}

TEST_F(ExecToolsTest, SchemaNamesThePayloadParameter) {
    for (const auto& definition : registry_.GetDefinitions()) {
        const auto schema = nlohmann::json::parse(definition.parameters_json);
        const std::string payload = definition.name == "exec" ? "command" : "code";
        EXPECT_EQ(schema["required"], nlohmann::json::array({payload})) << definition.name;
        EXPECT_EQ(schema["properties"][payload]["type"], "string");
        EXPECT_EQ(schema["properties"]["timeout"]["type"], "integer");
    }
}

TEST_F(ExecToolsTest, ShellToolRunsInSession) {
    if (!testing::HaveBinary("bash")) {
        GTEST_SKIP() << "bash not available";
    }
    EXPECT_EQ(registry_.Execute("exec", {{"command", "echo tool"}}), "tool\n");
    EXPECT_EQ(registry_.Execute("exec", {{"command", "true"}}), "(no output)");
    EXPECT_TRUE(utils::StartsWith(registry_.Execute("exec", {{"command", "exit 3"}}), "\n\n---\n**Code Execution Failed**"));
}

}  // namespace
}  // namespace safexec::tools
