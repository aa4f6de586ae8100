#pragma once

#include "core/RequestContext.hpp"
#include "mcp/ProtocolHandler.hpp"
#include "transport/TransportTypes.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace gitmcp {
namespace transport {

/**
 * Common base for the stateful and stateless managers: both build protocol
 * handlers through the injected factory and turn handler output into a
 * TransportResponse.
 */
class TransportManager {
public:
    explicit TransportManager(mcp::ProtocolHandlerFactory factory);
    virtual ~TransportManager() = default;

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    virtual TransportResponse handleRequest(const Headers& headers,
                                            const json& body,
                                            const core::RequestContext& ctx,
                                            const std::optional<std::string>& sessionId) = 0;

    virtual void shutdown() = 0;

    // Frame responses as SSE when the client accepts text/event-stream
    void setSseResponses(bool enabled) { m_sseResponses = enabled; }
    bool sseResponses() const { return m_sseResponses; }

protected:
    /**
     * null result -> 204, otherwise 200 with the JSON body, or an SSE stream
     * when enabled and the request's Accept header lists text/event-stream
     */
    TransportResponse makeResponse(const json& result, const Headers& requestHeaders) const;

    mcp::ProtocolHandlerFactory m_factory;

private:
    std::atomic<bool> m_sseResponses{false};
};

/**
 * Closes a handler when leaving scope, whatever the exit path.
 */
class HandlerCloseGuard {
public:
    explicit HandlerCloseGuard(mcp::ProtocolHandlerPtr handler)
        : m_handler(std::move(handler)) {}
    ~HandlerCloseGuard();

    HandlerCloseGuard(const HandlerCloseGuard&) = delete;
    HandlerCloseGuard& operator=(const HandlerCloseGuard&) = delete;

private:
    mcp::ProtocolHandlerPtr m_handler;
};

} // namespace transport
} // namespace gitmcp
