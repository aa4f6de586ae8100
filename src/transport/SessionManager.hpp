#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitmcp {
namespace transport {

/**
 * Metadata for one stateful session. Times are milliseconds since epoch.
 */
struct SessionMetadata {
    std::string sessionId;
    int64_t createdAt = 0;
    int64_t lastActivityAt = 0;
    std::optional<std::string> clientId;
    std::optional<std::string> tenantId;
};

struct SessionManagerOptions {
    int64_t staleTimeoutMs = 30 * 60 * 1000;
    int64_t cleanupIntervalMs = 5 * 60 * 1000;
};

/**
 * SessionManager - sole authority on session existence and staleness.
 *
 * Explicitly constructed and handed by reference to the transport managers.
 * The background sweep runs on the given io_context once start() is called
 * and is cancelled by stop(), letting io_context::run() return.
 *
 * Expiry is lazy and destructive: an entry found stale by isSessionValid()
 * is erased at that moment and never served again.
 */
class SessionManager {
public:
    using Clock = std::function<int64_t()>;
    using ExpiryListener = std::function<void(const std::vector<std::string>&)>;

    SessionManager(boost::asio::io_context& ioc,
                   SessionManagerOptions options = {},
                   Clock clock = systemClock());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Start / stop the periodic sweep
    void start();
    void stop();
    void stopCleanupInterval() { stop(); }
    bool isRunning() const;

    /**
     * Register a session with createdAt = lastActivityAt = now.
     * Calling it again with the same id overwrites the previous entry.
     */
    std::string createSession(const std::string& sessionId,
                              const std::optional<std::string>& clientId = std::nullopt,
                              const std::optional<std::string>& tenantId = std::nullopt);

    /**
     * True if the session exists and is not stale. A stale entry is
     * removed before returning false. Does not bump activity.
     */
    bool isSessionValid(const std::string& sessionId);

    // Bump lastActivityAt to now (never backwards). No-op for unknown ids.
    void touchSession(const std::string& sessionId);

    // Remove the session. Returns whether it existed.
    bool terminateSession(const std::string& sessionId);

    // Copy of the metadata if the session is valid
    std::optional<SessionMetadata> getSessionMetadata(const std::string& sessionId);

    size_t getActiveSessionCount() const;

    /**
     * Remove every entry older than staleTimeoutMs. Called by the timer;
     * public so it can be driven directly. Returns the number removed.
     */
    size_t sweepStaleSessions();

    // Drop every session (emergency cleanup, tests)
    void clearAllSessions();

    /**
     * Called, without the registry lock held, with the ids removed by lazy
     * expiry or by the sweep. Explicit termination does not notify.
     */
    void setExpiryListener(ExpiryListener listener);

    const SessionManagerOptions& options() const { return m_options; }

    static Clock systemClock();

private:
    // Outlives the manager inside queued timer handlers; owner is cleared by the destructor
    struct SweepGuard {
        std::mutex mutex;
        SessionManager* owner = nullptr;
    };

    bool isStale(const SessionMetadata& session, int64_t now) const;
    void scheduleSweep();
    void onSweepTimer();
    void notifyExpired(const std::vector<std::string>& ids);

    boost::asio::io_context& m_ioc;
    SessionManagerOptions m_options;
    Clock m_clock;

    std::unordered_map<std::string, SessionMetadata> m_sessions;
    mutable std::mutex m_mutex;

    std::unique_ptr<boost::asio::steady_timer> m_sweepTimer;
    std::shared_ptr<SweepGuard> m_sweepGuard;
    bool m_running = false;

    std::mutex m_listenerMutex;
    ExpiryListener m_expiryListener;
};

} // namespace transport
} // namespace gitmcp
