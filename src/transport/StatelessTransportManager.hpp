#pragma once

#include "transport/TransportManager.hpp"

namespace gitmcp {
namespace transport {

/**
 * One fresh protocol handler per request, closed before returning.
 * Nothing survives between requests; a client-supplied session id is only
 * echoed back.
 */
class StatelessTransportManager : public TransportManager {
public:
    explicit StatelessTransportManager(mcp::ProtocolHandlerFactory factory);

    // Failures come back as an error response, never as an exception
    TransportResponse handleRequest(const Headers& headers,
                                    const json& body,
                                    const core::RequestContext& ctx,
                                    const std::optional<std::string>& sessionId) override;

    void shutdown() override;
};

} // namespace transport
} // namespace gitmcp
