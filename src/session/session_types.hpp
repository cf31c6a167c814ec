#pragma once

#include <string>

namespace safexec::session {

struct SessionKey {
    std::string agent_id;
    std::string conversation_id;

    std::string ToString() const {
        return agent_id + ":" + conversation_id;
    }

    bool operator==(const SessionKey& other) const {
        return agent_id == other.agent_id && conversation_id == other.conversation_id;
    }
};

struct SessionInfo {
    std::string agent_id;
    std::string conversation_id;
    std::string workspace;
    std::string cwd;
    std::string backend;
    std::string created_at;
    std::string updated_at;
};

}  // namespace safexec::session
