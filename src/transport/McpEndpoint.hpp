#pragma once

#include "auth/AuthMiddleware.hpp"
#include "transport/CorsPolicy.hpp"
#include "transport/RequestRouting.hpp"
#include "transport/SessionManager.hpp"
#include "transport/StatefulTransportManager.hpp"
#include "transport/StatelessTransportManager.hpp"
#include "transport/TransportTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace gitmcp {
namespace transport {

struct McpEndpointOptions {
    std::string endpointPath = "/mcp";
    SessionMode sessionMode = SessionMode::Auto;
    std::vector<std::string> allowedOrigins;   // empty = any origin
};

/**
 * The MCP endpoint, independent of the HTTP library.
 *
 * For each request, in order: origin check (403) and preflight, protocol
 * version (400), session id validity (404), authentication (401), dispatch
 * to the stateful or stateless manager, response translation. Exceptions
 * from any step end in HttpErrorHandler; handle() itself does not throw.
 */
class McpEndpoint {
public:
    McpEndpoint(McpEndpointOptions options,
                SessionManager& sessions,
                StatefulTransportManager& stateful,
                StatelessTransportManager& stateless,
                std::shared_ptr<const auth::AuthMiddleware> auth = nullptr);

    const std::string& path() const { return m_options.endpointPath; }
    SessionMode sessionMode() const { return m_options.sessionMode; }
    const CorsPolicy& cors() const { return m_cors; }

    TransportResponse handle(const HttpRequest& request);

private:
    TransportResponse process(const HttpRequest& request, const core::RequestContext& ctx, json& body);
    TransportResponse handlePost(const HttpRequest& request, const core::RequestContext& ctx, json& body);
    TransportResponse handleDelete(const HttpRequest& request, const core::RequestContext& ctx);
    core::RequestContext authenticate(const HttpRequest& request, const core::RequestContext& ctx) const;

    // Non-object bodies are wrapped so the HTTP layer always serializes an object or array
    static void normalizeBody(TransportResponse& response);

    McpEndpointOptions m_options;
    CorsPolicy m_cors;
    SessionManager& m_sessions;
    StatefulTransportManager& m_stateful;
    StatelessTransportManager& m_stateless;
    std::shared_ptr<const auth::AuthMiddleware> m_auth;
};

} // namespace transport
} // namespace gitmcp
