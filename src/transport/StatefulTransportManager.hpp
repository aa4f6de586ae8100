#pragma once

#include "transport/SessionManager.hpp"
#include "transport/TransportManager.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitmcp {
namespace transport {

/**
 * Binds one long-lived protocol handler to each session id.
 *
 * Per-session states: absent -> initializing -> active -> closed.
 * The manager is the only owner of handler instances. Any path that removes
 * an entry from the handler map takes the handler out under the lock and
 * closes it right after releasing the lock: a lookup can never reach a
 * removed handler, and a close that waits on an in-flight tool call does not
 * hold up other sessions.
 *
 * Lock order: this manager's mutex, then SessionManager's. Calls that may
 * fire the expiry listener (isSessionValid, getSessionMetadata) are made
 * without this manager's mutex held.
 */
class StatefulTransportManager : public TransportManager {
public:
    StatefulTransportManager(mcp::ProtocolHandlerFactory factory, SessionManager& sessions);
    ~StatefulTransportManager() override;

    /**
     * Mint a session id, build a handler and run the initialize exchange.
     * On success the session is registered and its id returned in the
     * Mcp-Session-Id header. On failure nothing stays registered: a handler
     * error response is returned as-is, an exception becomes
     * McpError(InitializationFailed).
     */
    TransportResponse initializeAndHandle(const Headers& headers,
                                          const json& body,
                                          const core::RequestContext& ctx);

    /**
     * Dispatch to the handler bound to sessionId. Unknown or expired ids get
     * the 404 "session expired" response; no session is ever created here.
     */
    TransportResponse handleRequest(const Headers& headers,
                                    const json& body,
                                    const core::RequestContext& ctx,
                                    const std::optional<std::string>& sessionId) override;

    // 204 when the session existed, 404 otherwise. Safe to repeat.
    TransportResponse handleDeleteRequest(const std::string& sessionId,
                                          const core::RequestContext& ctx);

    std::optional<SessionMetadata> getSession(const std::string& sessionId);
    size_t activeHandlerCount() const;

    // Close every session. Later initialize calls are refused.
    void shutdown() override;

private:
    // Requires m_mutex held. Erases the entry and hands the handler to the caller to close.
    mcp::ProtocolHandlerPtr takeHandlerLocked(const std::string& sessionId);

    // Handler dispose + registry termination as one step
    bool closeSession(const std::string& sessionId);

    // SessionManager expiry listener
    void onSessionsExpired(const std::vector<std::string>& sessionIds);

    static bool isSuccessfulResponse(const json& result);

    SessionManager& m_sessions;
    std::unordered_map<std::string, mcp::ProtocolHandlerPtr> m_handlers;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_shutdown{false};
};

} // namespace transport
} // namespace gitmcp
