#include "server/RequestRouter.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "transport/HttpErrorHandler.hpp"
#include "transport/RequestRouting.hpp"
#include "core/McpError.hpp"
#include "core/RequestContext.hpp"

namespace gitmcp {
namespace server {

using transport::TransportResponse;

RequestRouter::RequestRouter(transport::McpEndpoint& endpoint,
                             const transport::StatefulTransportManager& stateful,
                             ServerStatusInfo info)
    : m_endpoint(endpoint)
    , m_stateful(stateful)
    , m_info(std::move(info))
{
}

json RequestRouter::statusJson() const {
    json status = {
        {"status", "ok"},
        {"server", {
            {"name", m_info.name},
            {"version", m_info.version},
            {"description", m_info.description},
            {"environment", m_info.environment},
            {"transport", m_info.transport},
            {"sessionMode", transport::sessionModeName(m_endpoint.sessionMode())}
        }},
        {"sessions", {
            {"active", m_stateful.activeHandlerCount()}
        }}
    };
    if (Profiler::instance().isEnabled()) {
        status["profiler"] = Profiler::instance().toJson();
    }
    return status;
}

// A disallowed origin gets the body without Access-Control-* headers
TransportResponse RequestRouter::withCors(const transport::HttpRequest& request, TransportResponse response) const {
    auto origin = request.headers.get("Origin");
    if (m_endpoint.cors().isOriginAllowed(origin)) {
        m_endpoint.cors().applyHeaders(origin, response.headers);
    }
    return response;
}

TransportResponse RequestRouter::route(const transport::HttpRequest& request) {
    ScopedTimer timer("http." + request.method);

    try {
        if (request.path == "/healthz" && request.method == "GET") {
            return withCors(request, TransportResponse::withBody(200, json{{"status", "ok"}}));
        }

        if (request.path == m_endpoint.path()) {
            if (request.method == "GET") {
                return withCors(request, TransportResponse::withBody(200, statusJson()));
            }
            TransportResponse res = m_endpoint.handle(request);
            if (res.statusCode >= 500) {
                timer.markFailed();
            }
            return res;
        }

        return transport::jsonRpcErrorResponse(
            404, static_cast<int>(core::JsonRpcErrorCode::NotFound),
            "Not found: " + request.method + " " + request.path);

    } catch (const std::exception& e) {
        timer.markFailed();
        auto ctx = core::RequestContext::create("RequestRouter.route")
                       .withField("path", request.path);
        return transport::HttpErrorHandler::handle(e, ctx);
    }
}

} // namespace server
} // namespace gitmcp
