#include "transport/StatelessTransportManager.hpp"
#include "transport/HttpErrorHandler.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"

namespace gitmcp {
namespace transport {

StatelessTransportManager::StatelessTransportManager(mcp::ProtocolHandlerFactory factory)
    : TransportManager(std::move(factory))
{
    LOG_DEBUG("Stateless transport manager ready");
}

TransportResponse StatelessTransportManager::handleRequest(const Headers& headers,
                                                           const json& body,
                                                           const core::RequestContext& ctx,
                                                           const std::optional<std::string>& sessionId) {
    server::ScopedTimer timer("transport.stateless");
    auto opCtx = ctx.withOperation("StatelessTransportManager.handleRequest");

    try {
        mcp::ProtocolHandlerPtr handler = m_factory();
        HandlerCloseGuard guard(handler);

        json result = handler->handle(body, opCtx);
        TransportResponse res = makeResponse(result, headers);
        if (sessionId) {
            res.sessionId = sessionId;
        }
        return res;
    } catch (const std::exception& e) {
        timer.markFailed();
        return HttpErrorHandler::handle(e, opCtx, HttpErrorHandler::extractRequestId(body));
    }
}

void StatelessTransportManager::shutdown() {
    LOG_DEBUG("Stateless transport manager shut down (no retained state)");
}

} // namespace transport
} // namespace gitmcp
