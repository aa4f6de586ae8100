#include "auth/AuthMiddleware.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace gitmcp {
namespace auth {

using core::JsonRpcErrorCode;
using core::McpError;

AuthMiddleware::AuthMiddleware(AuthStrategyPtr strategy)
    : m_strategy(std::move(strategy))
{
    if (!m_strategy) {
        throw std::invalid_argument("AuthMiddleware requires a strategy");
    }
}

std::optional<std::string> AuthMiddleware::extractBearerToken(const std::optional<std::string>& header) {
    static const std::string prefix = "Bearer ";
    if (!header || header->compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string token = header->substr(prefix.size());
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

core::RequestContext AuthMiddleware::authenticate(const transport::Headers& headers,
                                                  const core::RequestContext& ctx) const {
    auto authCtx = ctx.withOperation("authMiddleware");

    auto token = extractBearerToken(headers.get("Authorization"));
    if (!token) {
        LOG_WARN_CTX("Authorization header missing or invalid", authCtx);
        throw McpError(JsonRpcErrorCode::Unauthorized,
                       "Missing or invalid Authorization header. Bearer scheme required.");
    }

    AuthInfo info;
    try {
        info = m_strategy->verify(*token);
    } catch (const McpError& e) {
        LOG_WARN_CTX("Authentication verification failed", authCtx.withField("error", e.what()));
        throw McpError(JsonRpcErrorCode::Unauthorized, e.what());
    }

    auto verified = ctx.withAuth(info.clientId, info.tenantId, info.subject, info.scopes);
    LOG_DEBUG_CTX("Authentication successful", verified);
    return verified;
}

} // namespace auth
} // namespace gitmcp
