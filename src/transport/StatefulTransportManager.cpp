#include "transport/StatefulTransportManager.hpp"
#include "transport/HttpErrorHandler.hpp"
#include "core/IdGenerator.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"

namespace gitmcp {
namespace transport {

using core::JsonRpcErrorCode;
using core::McpError;

namespace {

void closeQuietly(const mcp::ProtocolHandlerPtr& handler, const std::string& sessionId) {
    try {
        handler->close();
    } catch (const std::exception& e) {
        LOG_WARN("Failed to close handler for session " + sessionId + ": " + e.what());
    }
}

} // anonymous namespace

StatefulTransportManager::StatefulTransportManager(mcp::ProtocolHandlerFactory factory,
                                                   SessionManager& sessions)
    : TransportManager(std::move(factory))
    , m_sessions(sessions)
{
    m_sessions.setExpiryListener([this](const std::vector<std::string>& ids) {
        onSessionsExpired(ids);
    });
    LOG_DEBUG("Stateful transport manager ready");
}

StatefulTransportManager::~StatefulTransportManager() {
    m_sessions.setExpiryListener(nullptr);
    shutdown();
}

bool StatefulTransportManager::isSuccessfulResponse(const json& result) {
    auto isError = [](const json& msg) { return msg.is_object() && msg.contains("error"); };
    auto isResult = [](const json& msg) { return msg.is_object() && msg.contains("result"); };

    if (result.is_array()) {
        bool anyResult = false;
        for (const auto& msg : result) {
            if (isError(msg)) return false;
            anyResult = anyResult || isResult(msg);
        }
        return anyResult;
    }
    return isResult(result) && !isError(result);
}

// =============================================================================
// Initialize
// =============================================================================

TransportResponse StatefulTransportManager::initializeAndHandle(const Headers& headers,
                                                                const json& body,
                                                                const core::RequestContext& ctx) {
    server::ScopedTimer timer("transport.initialize");

    if (m_shutdown) {
        timer.markFailed();
        throw McpError(JsonRpcErrorCode::ServiceUnavailable, "Server is shutting down");
    }

    const std::string sessionId = core::IdGenerator::generateUuid();
    auto sessionCtx = ctx.withSessionId(sessionId)
                         .withOperation("StatefulTransportManager.initializeAndHandle");
    LOG_DEBUG_CTX("Initializing new stateful session", sessionCtx);

    mcp::ProtocolHandlerPtr handler;
    json result;
    try {
        handler = m_factory();
        result = handler->handle(body, sessionCtx);
    } catch (const std::exception& e) {
        timer.markFailed();
        if (handler) {
            closeQuietly(handler, sessionId);
        }
        LOG_ERROR_CTX("Session initialization failed", sessionCtx.withField("error", e.what()));
        throw McpError(JsonRpcErrorCode::InitializationFailed, "Failed to initialize session");
    }

    if (!isSuccessfulResponse(result)) {
        // initializing -> closed: nothing was registered
        timer.markFailed();
        closeQuietly(handler, sessionId);
        LOG_WARN_CTX("Initialize rejected by protocol handler", sessionCtx);

        const json* errCode = nullptr;
        if (result.is_object() && result.contains("error") && result["error"].is_object()) {
            auto it = result["error"].find("code");
            if (it != result["error"].end() && it->is_number_integer()) {
                errCode = &*it;
            }
        }
        if (errCode) {
            auto code = static_cast<JsonRpcErrorCode>(errCode->get<int>());
            return TransportResponse::withBody(HttpErrorHandler::statusFor(code), result);
        }
        return TransportResponse::withBody(
            400, core::makeJsonRpcError(JsonRpcErrorCode::InvalidRequest,
                                        "Initialize must be sent as a request",
                                        HttpErrorHandler::extractRequestId(body)));
    }

    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_shutdown) {
            m_handlers[sessionId] = handler;
            m_sessions.createSession(sessionId, ctx.clientId(), ctx.tenantId());
            registered = true;
        }
    }
    if (!registered) {
        closeQuietly(handler, sessionId);
        throw McpError(JsonRpcErrorCode::ServiceUnavailable, "Server is shutting down");
    }

    LOG_INFO_CTX("MCP session created", sessionCtx);

    TransportResponse res = makeResponse(result, headers);
    res.sessionId = sessionId;
    res.headers.set(kSessionIdHeader, sessionId);
    return res;
}

// =============================================================================
// Requests on an existing session
// =============================================================================

TransportResponse StatefulTransportManager::handleRequest(const Headers& headers,
                                                          const json& body,
                                                          const core::RequestContext& ctx,
                                                          const std::optional<std::string>& sessionId) {
    if (!sessionId || sessionId->empty()) {
        return jsonRpcErrorResponse(400, static_cast<int>(JsonRpcErrorCode::InvalidRequest),
                                    "Mcp-Session-Id header is required");
    }

    server::ScopedTimer timer("transport.session_request");
    const std::string& id = *sessionId;
    auto sessionCtx = ctx.withSessionId(id).withOperation("StatefulTransportManager.handleRequest");

    if (!m_sessions.isSessionValid(id)) {
        // active -> closed on expiry; the listener normally did this already
        mcp::ProtocolHandlerPtr stale;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            stale = takeHandlerLocked(id);
        }
        if (stale) {
            closeQuietly(stale, id);
        }
        LOG_WARN_CTX("Request for unknown or expired session", sessionCtx);
        timer.markFailed();
        return sessionExpiredResponse();
    }

    mcp::ProtocolHandlerPtr handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handlers.find(id);
        if (it != m_handlers.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        // Registry entry without a handler (shutdown in progress): not servable
        m_sessions.terminateSession(id);
        LOG_WARN_CTX("Session has no live handler", sessionCtx);
        timer.markFailed();
        return sessionExpiredResponse();
    }

    json result;
    try {
        result = handler->handle(body, sessionCtx);
    } catch (const mcp::HandlerClosedError&) {
        // Disposed by a concurrent expiry or DELETE
        closeSession(id);
        timer.markFailed();
        return sessionExpiredResponse();
    } catch (const std::exception& e) {
        timer.markFailed();
        LOG_ERROR_CTX("Protocol handler failed, closing session", sessionCtx.withField("error", e.what()));
        closeSession(id);
        throw;
    }

    m_sessions.touchSession(id);

    TransportResponse res = makeResponse(result, headers);
    res.sessionId = id;
    res.headers.set(kSessionIdHeader, id);
    return res;
}

TransportResponse StatefulTransportManager::handleDeleteRequest(const std::string& sessionId,
                                                                const core::RequestContext& ctx) {
    auto sessionCtx = ctx.withSessionId(sessionId)
                         .withOperation("StatefulTransportManager.handleDeleteRequest");

    if (!closeSession(sessionId)) {
        LOG_DEBUG_CTX("DELETE for unknown session", sessionCtx);
        return jsonRpcErrorResponse(404, static_cast<int>(JsonRpcErrorCode::NotFound), "Session not found");
    }

    LOG_INFO_CTX("MCP session terminated by client", sessionCtx);
    TransportResponse res = TransportResponse::noContent(204);
    res.sessionId = sessionId;
    return res;
}

// =============================================================================
// Bookkeeping
// =============================================================================

mcp::ProtocolHandlerPtr StatefulTransportManager::takeHandlerLocked(const std::string& sessionId) {
    auto it = m_handlers.find(sessionId);
    if (it == m_handlers.end()) {
        return nullptr;
    }
    mcp::ProtocolHandlerPtr handler = std::move(it->second);
    m_handlers.erase(it);
    return handler;
}

bool StatefulTransportManager::closeSession(const std::string& sessionId) {
    mcp::ProtocolHandlerPtr handler;
    bool hadSession = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = takeHandlerLocked(sessionId);
        hadSession = m_sessions.terminateSession(sessionId);
    }

    // close() waits for an in-flight call on this handler; other sessions must not
    if (handler) {
        closeQuietly(handler, sessionId);
    }
    return handler != nullptr || hadSession;
}

void StatefulTransportManager::onSessionsExpired(const std::vector<std::string>& sessionIds) {
    std::vector<std::pair<std::string, mcp::ProtocolHandlerPtr>> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& id : sessionIds) {
            if (auto handler = takeHandlerLocked(id)) {
                expired.emplace_back(id, std::move(handler));
            }
        }
    }

    for (const auto& [id, handler] : expired) {
        closeQuietly(handler, id);
    }
    if (!expired.empty()) {
        LOG_INFO("Disposed " + std::to_string(expired.size()) + " handler(s) for expired sessions");
    }
}

std::optional<SessionMetadata> StatefulTransportManager::getSession(const std::string& sessionId) {
    auto meta = m_sessions.getSessionMetadata(sessionId);
    if (!meta) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_handlers.count(sessionId) == 0) {
        return std::nullopt;
    }
    return meta;
}

size_t StatefulTransportManager::activeHandlerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handlers.size();
}

void StatefulTransportManager::shutdown() {
    m_shutdown = true;

    std::unordered_map<std::string, mcp::ProtocolHandlerPtr> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handlers.swap(m_handlers);
        for (const auto& entry : handlers) {
            m_sessions.terminateSession(entry.first);
        }
    }

    for (const auto& [id, handler] : handlers) {
        closeQuietly(handler, id);
    }
    if (!handlers.empty()) {
        LOG_INFO("Closed " + std::to_string(handlers.size()) + " stateful session(s) on shutdown");
    }
}

} // namespace transport
} // namespace gitmcp
