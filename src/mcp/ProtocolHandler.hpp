#pragma once

#include "core/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace gitmcp {
namespace mcp {

using json = nlohmann::json;

/**
 * Raised by a handler that has already been closed. The transport maps it
 * to the "session expired or invalid" response.
 */
class HandlerClosedError : public std::runtime_error {
public:
    HandlerClosedError()
        : std::runtime_error("Protocol handler is closed") {}
};

/**
 * One MCP protocol endpoint: interprets JSON-RPC messages and runs tools.
 * Implementations serialize their own access; several requests for the
 * same session may call handle() concurrently.
 */
class ProtocolHandler {
public:
    virtual ~ProtocolHandler() = default;

    /**
     * Process one JSON-RPC message or batch.
     * Returns the response message (or array for batches), or null when the
     * input contained only notifications.
     */
    virtual json handle(const json& message, const core::RequestContext& ctx) = 0;

    // Release session resources. Idempotent.
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

using ProtocolHandlerPtr = std::shared_ptr<ProtocolHandler>;
using ProtocolHandlerFactory = std::function<ProtocolHandlerPtr()>;

} // namespace mcp
} // namespace gitmcp
