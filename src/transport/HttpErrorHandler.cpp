#include "transport/HttpErrorHandler.hpp"
#include "mcp/ProtocolHandler.hpp"
#include "server/Logger.hpp"

namespace gitmcp {
namespace transport {

using core::JsonRpcErrorCode;

unsigned HttpErrorHandler::statusFor(JsonRpcErrorCode code) {
    switch (code) {
        case JsonRpcErrorCode::NotFound:
            return 404;
        case JsonRpcErrorCode::Unauthorized:
            return 401;
        case JsonRpcErrorCode::Forbidden:
            return 403;
        case JsonRpcErrorCode::ParseError:
        case JsonRpcErrorCode::InvalidRequest:
        case JsonRpcErrorCode::InvalidParams:
        case JsonRpcErrorCode::ValidationError:
            return 400;
        case JsonRpcErrorCode::Conflict:
            return 409;
        case JsonRpcErrorCode::RateLimited:
            return 429;
        case JsonRpcErrorCode::ServiceUnavailable:
            return 503;
        default:
            return 500;
    }
}

json HttpErrorHandler::extractRequestId(const json& body) {
    if (body.is_object() && body.contains("id")) {
        const json& id = body["id"];
        if (id.is_string() || id.is_number()) {
            return id;
        }
    }
    return nullptr;
}

TransportResponse HttpErrorHandler::handle(const std::exception& error,
                                           const core::RequestContext& ctx,
                                           const json& requestId) {
    auto errCtx = ctx.withField("error", error.what());

    if (dynamic_cast<const mcp::HandlerClosedError*>(&error)) {
        LOG_WARN_CTX("Request reached a closed protocol handler", errCtx);
        return sessionExpiredResponse(requestId);
    }

    if (auto mcpError = dynamic_cast<const core::McpError*>(&error)) {
        unsigned status = statusFor(mcpError->code());
        auto logCtx = errCtx.withField("errorCode", mcpError->numericCode())
                            .withField("status", status);
        if (status >= 500) {
            LOG_ERROR_CTX("Request failed: " + core::errorCodeName(mcpError->code()), logCtx);
        } else {
            LOG_WARN_CTX("Request rejected: " + core::errorCodeName(mcpError->code()), logCtx);
        }

        return TransportResponse::withBody(
            status,
            core::makeJsonRpcError(mcpError->code(), mcpError->what(), requestId, mcpError->data()));
    }

    LOG_ERROR_CTX("Unhandled exception in request pipeline", errCtx.withField("status", 500));
    return TransportResponse::withBody(
        500, core::makeJsonRpcError(JsonRpcErrorCode::InternalError, "Internal error", requestId));
}

} // namespace transport
} // namespace gitmcp
