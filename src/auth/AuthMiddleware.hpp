#pragma once

#include "auth/AuthStrategy.hpp"
#include "core/RequestContext.hpp"
#include "transport/TransportTypes.hpp"
#include <optional>
#include <string>

namespace gitmcp {
namespace auth {

/**
 * Extracts "Authorization: Bearer <token>", verifies it through the
 * strategy and returns the request context extended with the identity.
 * Failures throw core::McpError(Unauthorized).
 */
class AuthMiddleware {
public:
    explicit AuthMiddleware(AuthStrategyPtr strategy);

    core::RequestContext authenticate(const transport::Headers& headers,
                                      const core::RequestContext& ctx) const;

    // Token part of a "Bearer <token>" header value
    static std::optional<std::string> extractBearerToken(const std::optional<std::string>& header);

private:
    AuthStrategyPtr m_strategy;
};

} // namespace auth
} // namespace gitmcp
