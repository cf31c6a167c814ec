#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "sandbox/sandbox_types.hpp"
#include "session/session_types.hpp"
#include "sqlite3.h"

namespace safexec::session {

class SessionStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Resolves `path` against `current` inside the sandbox and normalizes it.
// An empty path or "~" means the sandbox root.
std::string NormalizeSandboxPath(const std::string& current, const std::string& path);

// Host layout of one session directory:
//   .safexec_session.json   record, host-only
//   state/                  per-call staging, host-only apart from call mounts
//   workspace/              mounted read-write as /workspace
class Session {
public:
    Session(SessionKey key, std::filesystem::path directory);

    const SessionKey& Key() const { return key_; }
    const std::filesystem::path& Directory() const { return directory_; }
    std::filesystem::path Workspace() const { return directory_ / "workspace"; }
    std::filesystem::path StateDir() const { return directory_ / "state"; }
    std::filesystem::path RecordPath() const { return directory_ / ".safexec_session.json"; }

    std::string Cwd() const;
    std::optional<sandbox::BackendKind> Backend() const;
    std::string CreatedAt() const;
    std::string UpdatedAt() const;

private:
    friend class SessionStore;

    SessionKey key_;
    std::filesystem::path directory_;
    std::string cwd_ = sandbox::kSandboxRoot;
    std::optional<sandbox::BackendKind> backend_;
    std::string created_at_;
    std::string updated_at_;
    mutable std::mutex mutex_;
};

// Registry of sessions keyed by (agent, conversation). Each session owns a
// directory under `root`; its state is mirrored to a JSON record beside the
// workspace (never inside it) and indexed in `root/sessions.db`.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path root);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    std::shared_ptr<Session> GetOrCreate(const std::string& agent_id,
                                         const std::string& conversation_id);
    std::shared_ptr<Session> Get(const SessionKey& key);

    // Returns the normalized directory that was persisted.
    std::string UpdateCwd(Session& session, const std::string& new_path);
    void BindBackend(Session& session, sandbox::BackendKind backend);

    // Drops the session from the cache and the index. The session directory is
    // only deleted when `remove_workspace` is set.
    bool Evict(const SessionKey& key, bool remove_workspace = false);
    std::vector<SessionInfo> ListSessions() const;

    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path DirectoryFor(const SessionKey& key) const;

private:
    void LoadRecord(Session& session) const;
    // Caller holds session.mutex_.
    void PersistRecord(const Session& session) const;
    void IndexSession(const Session& session);
    void EnsureSchema();
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path root_;
    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, std::shared_ptr<Session>> cache_;
    mutable std::mutex mutex_;
};

}  // namespace safexec::session
