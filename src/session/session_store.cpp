#include "session/session_store.hpp"

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/fs.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace safexec::session {
namespace {

std::string CacheKey(const SessionKey& key) {
    return key.agent_id + '\n' + key.conversation_id;
}

std::string StripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

std::string NormalizeSandboxPath(const std::string& current, const std::string& path) {
    const auto trimmed = utils::Trim(path);
    std::filesystem::path target;
    if (trimmed.empty() || trimmed == "~") {
        target = sandbox::kSandboxRoot;
    } else if (utils::StartsWith(trimmed, "~/")) {
        target = std::filesystem::path(sandbox::kSandboxRoot) / trimmed.substr(2);
    } else if (trimmed.front() == '/') {
        target = trimmed;
    } else {
        const std::string base = current.empty() ? std::string(sandbox::kSandboxRoot) : current;
        target = std::filesystem::path(base) / trimmed;
    }
    auto normal = target.lexically_normal().string();
    if (normal.empty()) {
        return "/";
    }
    return StripTrailingSlash(normal);
}

Session::Session(SessionKey key, std::filesystem::path directory)
    : key_(std::move(key))
    , directory_(std::move(directory))
    , created_at_(utils::NowIso())
    , updated_at_(created_at_) {}

std::string Session::Cwd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cwd_;
}

std::optional<sandbox::BackendKind> Session::Backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_;
}

std::string Session::CreatedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_at_;
}

std::string Session::UpdatedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_at_;
}

SessionStore::SessionStore(std::filesystem::path root)
    : root_(std::move(root))
    , db_path_(root_ / "sessions.db") {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw SessionStoreError("cannot create workspace root " + root_.string() + ": " + ec.message());
    }
    EnsureSchema();
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::filesystem::path SessionStore::DirectoryFor(const SessionKey& key) const {
    return root_ / utils::Sha256Hex(CacheKey(key)).substr(0, 32);
}

std::shared_ptr<Session> SessionStore::GetOrCreate(const std::string& agent_id,
                                                   const std::string& conversation_id) {
    SessionKey key{agent_id, conversation_id};
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(CacheKey(key));
    if (it != cache_.end()) {
        return it->second;
    }

    auto session = std::make_shared<Session>(key, DirectoryFor(key));
    std::error_code ec;
    std::filesystem::create_directories(session->Workspace(), ec);
    if (!ec) {
        std::filesystem::create_directories(session->StateDir(), ec);
    }
    if (!ec) {
        std::filesystem::permissions(session->StateDir(), std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        throw SessionStoreError("cannot create session workspace " +
                                session->Workspace().string() + ": " + ec.message());
    }
    {
        std::lock_guard<std::mutex> session_lock(session->mutex_);
        LoadRecord(*session);
        PersistRecord(*session);
    }
    IndexSession(*session);
    cache_.emplace(CacheKey(key), session);
    utils::LogDebug("session", "opened", {
        {"key", key.ToString()},
        {"workspace", session->Workspace().string()},
        {"cwd", session->Cwd()}
    });
    return session;
}

std::shared_ptr<Session> SessionStore::Get(const SessionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(CacheKey(key));
    if (it == cache_.end()) {
        return nullptr;
    }
    return it->second;
}

std::string SessionStore::UpdateCwd(Session& session, const std::string& new_path) {
    std::string normalized;
    {
        std::lock_guard<std::mutex> session_lock(session.mutex_);
        normalized = NormalizeSandboxPath(session.cwd_, new_path);
        session.cwd_ = normalized;
        session.updated_at_ = utils::NowIso();
        PersistRecord(session);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSession(session);
    return normalized;
}

void SessionStore::BindBackend(Session& session, sandbox::BackendKind backend) {
    {
        std::lock_guard<std::mutex> session_lock(session.mutex_);
        if (session.backend_ == backend) {
            return;
        }
        session.backend_ = backend;
        session.updated_at_ = utils::NowIso();
        PersistRecord(session);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSession(session);
}

bool SessionStore::Evict(const SessionKey& key, bool remove_workspace) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool cached = cache_.erase(CacheKey(key)) > 0;
    bool indexed = false;
    if (db_) {
        sqlite3_stmt* stmt = nullptr;
        const std::string sql = "DELETE FROM sessions WHERE agent_id = ? AND conversation_id = ?;";
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(stmt, 1, key.agent_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, key.conversation_id.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) == SQLITE_DONE) {
                indexed = sqlite3_changes(db_) > 0;
            }
        }
        sqlite3_finalize(stmt);
    }
    if (remove_workspace) {
        std::error_code ec;
        std::filesystem::remove_all(DirectoryFor(key), ec);
        if (ec) {
            utils::LogWarn("session", "failed to remove workspace", {
                {"key", key.ToString()},
                {"error", ec.message()}
            });
        }
    }
    utils::LogInfo("session", "evicted", {{"key", key.ToString()}});
    return cached || indexed;
}

std::vector<SessionInfo> SessionStore::ListSessions() const {
    std::vector<SessionInfo> sessions;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sessions;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT agent_id, conversation_id, workspace, cwd, backend, created_at, updated_at "
        "FROM sessions ORDER BY updated_at DESC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return sessions;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionInfo info{};
        info.agent_id = SafeText(sqlite3_column_text(stmt, 0));
        info.conversation_id = SafeText(sqlite3_column_text(stmt, 1));
        info.workspace = SafeText(sqlite3_column_text(stmt, 2));
        info.cwd = SafeText(sqlite3_column_text(stmt, 3));
        info.backend = SafeText(sqlite3_column_text(stmt, 4));
        info.created_at = SafeText(sqlite3_column_text(stmt, 5));
        info.updated_at = SafeText(sqlite3_column_text(stmt, 6));
        sessions.push_back(std::move(info));
    }
    sqlite3_finalize(stmt);
    return sessions;
}

void SessionStore::LoadRecord(Session& session) const {
    const auto path = session.RecordPath();
    const auto contents = utils::ReadRegularFile(path);
    if (!contents.has_value()) {
        return;
    }
    try {
        const auto record = nlohmann::json::parse(*contents);
        if (!record.is_object()) {
            return;
        }
        const auto cwd = record.value("cwd", std::string());
        if (!cwd.empty() && cwd.front() == '/') {
            session.cwd_ = cwd;
        }
        const auto backend = sandbox::ParseBackendKind(record.value("backend", std::string()));
        if (backend.has_value()) {
            session.backend_ = backend;
        }
        const auto created_at = record.value("created_at", std::string());
        if (!created_at.empty()) {
            session.created_at_ = created_at;
        }
        session.updated_at_ = record.value("updated_at", session.created_at_);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("session", "ignoring corrupt session record", {
            {"path", path.string()},
            {"error", ex.what()}
        });
    }
}

void SessionStore::PersistRecord(const Session& session) const {
    nlohmann::json record = {
        {"agent_id", session.key_.agent_id},
        {"conversation_id", session.key_.conversation_id},
        {"cwd", session.cwd_},
        {"backend", session.backend_ ? sandbox::ToString(*session.backend_) : ""},
        {"created_at", session.created_at_},
        {"updated_at", session.updated_at_}
    };
    const auto path = session.RecordPath();
    if (!utils::ReplaceFile(path, record.dump(2))) {
        throw SessionStoreError("cannot write session record " + path.string());
    }
}

void SessionStore::IndexSession(const Session& session) {
    if (!db_) {
        return;
    }
    std::string cwd;
    std::string backend;
    std::string created_at;
    std::string updated_at;
    {
        std::lock_guard<std::mutex> session_lock(session.mutex_);
        cwd = session.cwd_;
        backend = session.backend_ ? sandbox::ToString(*session.backend_) : "";
        created_at = session.created_at_;
        updated_at = session.updated_at_;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string upsert_sql =
        "INSERT INTO sessions(agent_id, conversation_id, workspace, cwd, backend, created_at, updated_at) "
        "VALUES(?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(agent_id, conversation_id) DO UPDATE SET workspace=excluded.workspace, "
        "cwd=excluded.cwd, backend=excluded.backend, updated_at=excluded.updated_at;";
    if (sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        const auto workspace = session.Workspace().string();
        sqlite3_bind_text(stmt, 1, session.Key().agent_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, session.Key().conversation_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, workspace.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, cwd.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, backend.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, created_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, updated_at.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            utils::LogWarn("session", "index update failed", {
                {"key", session.Key().ToString()},
                {"error", sqlite3_errmsg(db_)}
            });
        }
    }
    sqlite3_finalize(stmt);
}

void SessionStore::EnsureSchema() {
    if (db_) {
        return;
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        utils::LogError("session", "failed to open sqlite db", {{"path", db_path_.string()}});
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, 5000);
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS sessions ("
             "agent_id TEXT NOT NULL,"
             "conversation_id TEXT NOT NULL,"
             "workspace TEXT,"
             "cwd TEXT,"
             "backend TEXT,"
             "created_at TEXT,"
             "updated_at TEXT,"
             "PRIMARY KEY(agent_id, conversation_id)"
             ");");
}

bool SessionStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            utils::LogError("session", "sqlite exec error", {{"error", err}});
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::string SessionStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace safexec::session
