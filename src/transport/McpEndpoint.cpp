#include "transport/McpEndpoint.hpp"
#include "transport/HttpErrorHandler.hpp"
#include "transport/ProtocolVersion.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"

namespace gitmcp {
namespace transport {

using core::JsonRpcErrorCode;

McpEndpoint::McpEndpoint(McpEndpointOptions options,
                         SessionManager& sessions,
                         StatefulTransportManager& stateful,
                         StatelessTransportManager& stateless,
                         std::shared_ptr<const auth::AuthMiddleware> auth)
    : m_options(std::move(options))
    , m_cors(m_options.allowedOrigins)
    , m_sessions(sessions)
    , m_stateful(stateful)
    , m_stateless(stateless)
    , m_auth(std::move(auth))
{
}

TransportResponse McpEndpoint::handle(const HttpRequest& request) {
    auto ctx = core::RequestContext::create("McpEndpoint.handle")
                   .withField("httpMethod", request.method)
                   .withField("path", request.path);

    auto origin = request.headers.get("Origin");
    if (!m_cors.isOriginAllowed(origin)) {
        LOG_WARN_CTX("Origin rejected: " + *origin, ctx);
        return TransportResponse::withBody(
            403, core::makeJsonRpcError(JsonRpcErrorCode::Forbidden, "Origin not allowed"));
    }

    TransportResponse res;
    json body;
    try {
        res = process(request, ctx, body);
    } catch (const std::exception& e) {
        res = HttpErrorHandler::handle(e, ctx, HttpErrorHandler::extractRequestId(body));
    }

    normalizeBody(res);
    m_cors.applyHeaders(origin, res.headers);
    if (res.sessionId && !res.headers.has(kSessionIdHeader)) {
        res.headers.set(kSessionIdHeader, *res.sessionId);
    }
    return res;
}

TransportResponse McpEndpoint::process(const HttpRequest& request, const core::RequestContext& ctx, json& body) {
    if (request.method == "OPTIONS") {
        return TransportResponse::noContent(204);
    }

    if (request.method != "POST" && request.method != "DELETE") {
        TransportResponse res = jsonRpcErrorResponse(
            405, static_cast<int>(JsonRpcErrorCode::InvalidRequest), "Method not allowed");
        res.headers.set("Allow", "GET, POST, DELETE, OPTIONS");
        return res;
    }

    ProtocolVersionCheck version = negotiateProtocolVersion(request.headers);
    if (version.error) {
        return *version.error;
    }
    auto versionCtx = ctx.withField("protocolVersion", version.version);

    if (request.method == "DELETE") {
        return handleDelete(request, versionCtx);
    }
    return handlePost(request, versionCtx, body);
}

core::RequestContext McpEndpoint::authenticate(const HttpRequest& request, const core::RequestContext& ctx) const {
    if (!m_auth) {
        return ctx;
    }
    return m_auth->authenticate(request.headers, ctx);
}

TransportResponse McpEndpoint::handlePost(const HttpRequest& request, const core::RequestContext& ctx, json& body) {
    try {
        body = json::parse(request.body);
    } catch (const json::parse_error& e) {
        LOG_WARN_CTX("Invalid JSON body", ctx.withField("error", e.what()));
        return TransportResponse::withBody(
            400, core::makeJsonRpcError(JsonRpcErrorCode::ParseError, "Parse error"));
    }

    InboundRequest inbound = classifyRequest(body, request.headers.get(kSessionIdHeader));
    RouteDecision route = decideRoute(inbound, m_options.sessionMode);

    // A supplied session id that is unknown or stale is rejected before auth
    if (route.kind == RouteKind::StatefulRequest && !m_sessions.isSessionValid(*route.sessionId)) {
        LOG_WARN_CTX("Session expired or invalid", ctx.withSessionId(*route.sessionId));
        return sessionExpiredResponse();
    }

    core::RequestContext authCtx = authenticate(request, ctx);

    switch (route.kind) {
        case RouteKind::StatefulInitialize:
            return m_stateful.initializeAndHandle(request.headers, body, authCtx);

        case RouteKind::StatefulRequest:
            return m_stateful.handleRequest(request.headers, body, authCtx, route.sessionId);

        case RouteKind::Stateless:
            return m_stateless.handleRequest(request.headers, body, authCtx, route.sessionId);

        case RouteKind::MissingSessionId:
            return jsonRpcErrorResponse(400, static_cast<int>(JsonRpcErrorCode::InvalidRequest),
                                        "Mcp-Session-Id header is required",
                                        HttpErrorHandler::extractRequestId(body));
    }

    throw core::McpError(JsonRpcErrorCode::InternalError, "Unroutable request");
}

TransportResponse McpEndpoint::handleDelete(const HttpRequest& request, const core::RequestContext& ctx) {
    core::RequestContext authCtx = authenticate(request, ctx);

    if (m_options.sessionMode == SessionMode::Stateless) {
        return TransportResponse::withBody(200, json{
            {"status", "ok"},
            {"message", "No sessions to delete in stateless mode"}
        });
    }

    auto sessionId = request.headers.get(kSessionIdHeader);
    if (!sessionId || sessionId->empty()) {
        return jsonRpcErrorResponse(400, static_cast<int>(JsonRpcErrorCode::InvalidRequest),
                                    "Mcp-Session-Id header is required");
    }

    return m_stateful.handleDeleteRequest(*sessionId, authCtx);
}

void McpEndpoint::normalizeBody(TransportResponse& response) {
    if (auto body = std::get_if<json>(&response.payload)) {
        if (!body->is_null() && !body->is_object() && !body->is_array()) {
            json wrapped = {{"result", *body}};
            *body = std::move(wrapped);
        }
    }
}

} // namespace transport
} // namespace gitmcp
