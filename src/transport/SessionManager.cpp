#include "transport/SessionManager.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <chrono>

namespace gitmcp {
namespace transport {

SessionManager::Clock SessionManager::systemClock() {
    return [] {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    };
}

SessionManager::SessionManager(boost::asio::io_context& ioc,
                               SessionManagerOptions options,
                               Clock clock)
    : m_ioc(ioc)
    , m_options(options)
    , m_clock(std::move(clock))
    , m_sweepGuard(std::make_shared<SweepGuard>())
{
    m_sweepGuard->owner = this;
}

SessionManager::~SessionManager() {
    stop();
    // Waits for a sweep already running on another thread
    std::lock_guard<std::mutex> lock(m_sweepGuard->mutex);
    m_sweepGuard->owner = nullptr;
}

void SessionManager::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;

    m_running = true;
    m_sweepTimer = std::make_unique<boost::asio::steady_timer>(m_ioc);
    LOG_INFO("Session cleanup started (interval " + std::to_string(m_options.cleanupIntervalMs) +
             "ms, stale timeout " + std::to_string(m_options.staleTimeoutMs) + "ms)");
    scheduleSweep();
}

void SessionManager::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) return;

    m_running = false;
    if (m_sweepTimer) {
        m_sweepTimer->cancel();
    }
    LOG_INFO("Session cleanup stopped");
}

bool SessionManager::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

// Requires m_mutex held
void SessionManager::scheduleSweep() {
    m_sweepTimer->expires_after(std::chrono::milliseconds(m_options.cleanupIntervalMs));
    // A completed wait may still be queued after stop() or destruction
    m_sweepTimer->async_wait([guard = m_sweepGuard](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        std::lock_guard<std::mutex> lock(guard->mutex);
        if (guard->owner) {
            guard->owner->onSweepTimer();
        }
    });
}

void SessionManager::onSweepTimer() {
    if (!isRunning()) {
        return;
    }
    sweepStaleSessions();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        scheduleSweep();
    }
}

bool SessionManager::isStale(const SessionMetadata& session, int64_t now) const {
    return now - session.lastActivityAt > m_options.staleTimeoutMs;
}

std::string SessionManager::createSession(const std::string& sessionId,
                                          const std::optional<std::string>& clientId,
                                          const std::optional<std::string>& tenantId) {
    int64_t now = m_clock();

    SessionMetadata meta;
    meta.sessionId = sessionId;
    meta.createdAt = now;
    meta.lastActivityAt = now;
    meta.clientId = clientId;
    meta.tenantId = tenantId;

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions[sessionId] = std::move(meta);
        count = m_sessions.size();
    }

    LOG_DEBUG("Created session: " + sessionId + " (active: " + std::to_string(count) + ")");
    return sessionId;
}

bool SessionManager::isSessionValid(const std::string& sessionId) {
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) {
            return false;
        }
        if (!isStale(it->second, m_clock())) {
            return true;
        }
        m_sessions.erase(it);
        expired = true;
    }

    if (expired) {
        LOG_INFO("Session expired: " + sessionId);
        notifyExpired({sessionId});
    }
    return false;
}

void SessionManager::touchSession(const std::string& sessionId) {
    int64_t now = m_clock();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return;
    }
    it->second.lastActivityAt = std::max(it->second.lastActivityAt, now);
}

bool SessionManager::terminateSession(const std::string& sessionId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = m_sessions.erase(sessionId) > 0;
    }
    if (removed) {
        LOG_DEBUG("Terminated session: " + sessionId);
    }
    return removed;
}

std::optional<SessionMetadata> SessionManager::getSessionMetadata(const std::string& sessionId) {
    if (!isSessionValid(sessionId)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SessionManager::getActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

size_t SessionManager::sweepStaleSessions() {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        int64_t now = m_clock();
        for (auto it = m_sessions.begin(); it != m_sessions.end(); ) {
            if (isStale(it->second, now)) {
                removed.push_back(it->first);
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!removed.empty()) {
        LOG_INFO("Cleaned up " + std::to_string(removed.size()) + " stale sessions");
        notifyExpired(removed);
    }
    return removed.size();
}

void SessionManager::clearAllSessions() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        count = m_sessions.size();
        m_sessions.clear();
    }
    LOG_WARN("Cleared all sessions (" + std::to_string(count) + ")");
}

void SessionManager::setExpiryListener(ExpiryListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_expiryListener = std::move(listener);
}

void SessionManager::notifyExpired(const std::vector<std::string>& ids) {
    ExpiryListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_expiryListener;
    }
    if (listener) {
        listener(ids);
    }
}

} // namespace transport
} // namespace gitmcp
