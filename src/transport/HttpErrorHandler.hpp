#pragma once

#include "core/McpError.hpp"
#include "core/RequestContext.hpp"
#include "transport/TransportTypes.hpp"
#include <exception>

namespace gitmcp {
namespace transport {

/**
 * Single error boundary between the transport and the wire.
 *
 * Maps McpError codes to HTTP status codes and builds a JSON-RPC error body.
 * Full error detail is logged server-side; unexpected exceptions reach the
 * client only as the generic "Internal error".
 */
class HttpErrorHandler {
public:
    static unsigned statusFor(core::JsonRpcErrorCode code);

    static TransportResponse handle(const std::exception& error,
                                    const core::RequestContext& ctx,
                                    const json& requestId = nullptr);

    // JSON-RPC id of a single message, null for batches or unparseable bodies
    static json extractRequestId(const json& body);
};

} // namespace transport
} // namespace gitmcp
