#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <thread>

#include "session/session_store.hpp"
#include "test_support.hpp"

namespace safexec::session {
namespace {

TEST(NormalizeSandboxPathTest, ResolvesAgainstCurrentDirectory) {
    EXPECT_EQ(NormalizeSandboxPath("/workspace", "sub"), "/workspace/sub");
    EXPECT_EQ(NormalizeSandboxPath("/workspace/a", "../other/./x/"), "/workspace/other/x");
    EXPECT_EQ(NormalizeSandboxPath("/workspace/a", "/tmp/"), "/tmp");
    EXPECT_EQ(NormalizeSandboxPath("/workspace/a", "~"), "/workspace");
    EXPECT_EQ(NormalizeSandboxPath("/workspace/a", ""), "/workspace");
    EXPECT_EQ(NormalizeSandboxPath("/workspace/a", "~/b"), "/workspace/b");
    EXPECT_EQ(NormalizeSandboxPath("/", ".."), "/");
}

TEST(SessionStoreTest, GetOrCreateIsIdempotent) {
    testing::TempDir temp;
    SessionStore store(temp.Path());
    auto first = store.GetOrCreate("agent", "chat-1");
    store.UpdateCwd(*first, "project");
    auto second = store.GetOrCreate("agent", "chat-1");
    EXPECT_EQ(first, second);
    EXPECT_EQ(second->Cwd(), "/workspace/project");
    EXPECT_EQ(store.Get(SessionKey{"agent", "chat-1"}), first);
}

TEST(SessionStoreTest, EachSessionGetsItsOwnWorkspace) {
    testing::TempDir temp;
    SessionStore store(temp.Path());
    auto a = store.GetOrCreate("agent", "chat-1");
    auto b = store.GetOrCreate("agent", "chat-2");
    auto c = store.GetOrCreate("agent/..", "../chat-1");
    EXPECT_NE(a->Workspace(), b->Workspace());
    EXPECT_NE(a->Workspace(), c->Workspace());
    for (const auto& session : {a, b, c}) {
        EXPECT_TRUE(std::filesystem::is_directory(session->Workspace()));
        EXPECT_TRUE(std::filesystem::is_directory(session->StateDir()));
        EXPECT_EQ(session->Directory().parent_path(), temp.Path());
        EXPECT_EQ(session->Workspace().parent_path(), session->Directory());
        EXPECT_EQ(session->Cwd(), "/workspace");
    }
}

TEST(SessionStoreTest, StateSurvivesARestart) {
    testing::TempDir temp;
    {
        SessionStore store(temp.Path());
        auto session = store.GetOrCreate("agent", "chat");
        EXPECT_EQ(store.UpdateCwd(*session, "data/../reports"), "/workspace/reports");
        store.BindBackend(*session, sandbox::BackendKind::kContainer);
        EXPECT_TRUE(std::filesystem::exists(session->RecordPath()));
        EXPECT_FALSE(std::filesystem::exists(session->Workspace() / ".safexec_session.json"));
    }
    SessionStore restarted(temp.Path());
    auto session = restarted.GetOrCreate("agent", "chat");
    EXPECT_EQ(session->Cwd(), "/workspace/reports");
    ASSERT_TRUE(session->Backend().has_value());
    EXPECT_EQ(*session->Backend(), sandbox::BackendKind::kContainer);
}

TEST(SessionStoreTest, CorruptRecordFallsBackToDefaults) {
    testing::TempDir temp;
    std::filesystem::path record;
    {
        SessionStore store(temp.Path());
        record = store.GetOrCreate("agent", "chat")->RecordPath();
    }
    {
        std::ofstream output(record, std::ios::trunc);
        output << "{not json";
    }
    SessionStore restarted(temp.Path());
    EXPECT_EQ(restarted.GetOrCreate("agent", "chat")->Cwd(), "/workspace");
}

TEST(SessionStoreTest, RecordPlantedInTheWorkspaceIsIgnored) {
    testing::TempDir temp;
    std::filesystem::path workspace;
    {
        SessionStore store(temp.Path());
        auto session = store.GetOrCreate("agent", "chat");
        store.BindBackend(*session, sandbox::BackendKind::kNamespace);
        workspace = session->Workspace();
    }
    {
        std::ofstream output(workspace / ".safexec_session.json", std::ios::trunc);
        output << R"({"cwd":"/etc","backend":"direct"})";
    }
    SessionStore restarted(temp.Path());
    auto session = restarted.GetOrCreate("agent", "chat");
    EXPECT_EQ(session->Cwd(), "/workspace");
    ASSERT_TRUE(session->Backend().has_value());
    EXPECT_EQ(*session->Backend(), sandbox::BackendKind::kNamespace);
}

TEST(SessionStoreTest, RecordWritesNeverFollowSymlinks) {
    testing::TempDir temp;
    const auto victim = temp.Path() / "victim.txt";
    {
        std::ofstream output(victim);
        output << "untouched";
    }
    SessionStore store(temp.Path());
    auto session = store.GetOrCreate("agent", "chat");
    auto temp_record = session->RecordPath();
    temp_record += ".tmp";
    std::filesystem::create_symlink(victim, temp_record);
    std::filesystem::create_symlink(victim, session->Workspace() / ".safexec_session.json.tmp");

    EXPECT_EQ(store.UpdateCwd(*session, "moved"), "/workspace/moved");

    std::ifstream input(victim);
    std::string contents((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "untouched");
    EXPECT_FALSE(std::filesystem::is_symlink(session->RecordPath()));
    SessionStore restarted(temp.Path());
    EXPECT_EQ(restarted.GetOrCreate("agent", "chat")->Cwd(), "/workspace/moved");
}

TEST(SessionStoreTest, SymlinkedRecordIsNotRead) {
    testing::TempDir temp;
    const auto outside = temp.Path() / "outside.json";
    {
        std::ofstream output(outside);
        output << R"({"cwd":"/workspace/elsewhere","backend":"direct"})";
    }
    std::filesystem::path record;
    {
        SessionStore store(temp.Path());
        record = store.GetOrCreate("agent", "chat")->RecordPath();
    }
    std::filesystem::remove(record);
    std::filesystem::create_symlink(outside, record);
    SessionStore restarted(temp.Path());
    auto session = restarted.GetOrCreate("agent", "chat");
    EXPECT_EQ(session->Cwd(), "/workspace");
    EXPECT_FALSE(session->Backend().has_value());
}

TEST(SessionStoreTest, ListAndEvict) {
    testing::TempDir temp;
    SessionStore store(temp.Path());
    auto kept = store.GetOrCreate("agent", "keep");
    auto dropped = store.GetOrCreate("agent", "drop");
    store.UpdateCwd(*kept, "work");
    EXPECT_EQ(store.ListSessions().size(), 2u);

    EXPECT_TRUE(store.Evict(SessionKey{"agent", "drop"}));
    EXPECT_EQ(store.Get(SessionKey{"agent", "drop"}), nullptr);
    EXPECT_TRUE(std::filesystem::exists(dropped->Workspace()));
    EXPECT_FALSE(store.Evict(SessionKey{"agent", "drop"}));

    const auto sessions = store.ListSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].conversation_id, "keep");
    EXPECT_EQ(sessions[0].cwd, "/workspace/work");

    EXPECT_TRUE(store.Evict(SessionKey{"agent", "keep"}, true));
    EXPECT_FALSE(std::filesystem::exists(kept->Workspace()));
}

TEST(SessionStoreTest, ConcurrentLookupsShareOneSession) {
    testing::TempDir temp;
    SessionStore store(temp.Path());
    std::vector<std::shared_ptr<Session>> seen(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&store, &seen, i]() {
            seen[i] = store.GetOrCreate("agent", "shared");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& session : seen) {
        EXPECT_EQ(session, seen.front());
    }
}

TEST(SessionStoreTest, ConcurrentWritesAreNotLost) {
    testing::TempDir temp;
    std::vector<std::thread> threads;
    {
        SessionStore store(temp.Path());
        for (int i = 0; i < 6; ++i) {
            threads.emplace_back([&store, i]() {
                auto session = store.GetOrCreate("agent", "chat-" + std::to_string(i));
                for (int step = 0; step < 5; ++step) {
                    store.UpdateCwd(*session, "/workspace/t" + std::to_string(i) + "/s" + std::to_string(step));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
    SessionStore restarted(temp.Path());
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(restarted.GetOrCreate("agent", "chat-" + std::to_string(i))->Cwd(),
                  "/workspace/t" + std::to_string(i) + "/s4");
    }
    EXPECT_EQ(restarted.ListSessions().size(), 6u);
}

}  // namespace
}  // namespace safexec::session
