#pragma once

#include "auth/AuthStrategy.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace auth {

struct JwtStrategyOptions {
    std::optional<std::string> secretKey;       // MCP_AUTH_SECRET_KEY
    std::string environment = "development";
    // Identity handed out when no secret is configured outside production
    std::string devClientId = "dev-client-id";
    std::vector<std::string> devScopes = {"dev-scope"};
};

/**
 * HS256 bearer tokens signed with a shared secret.
 *
 * Claims: cid (or client_id) -> clientId, scp (string array, or a
 * space-separated "scope" string) -> scopes, tid -> tenantId,
 * sub -> subject. exp and nbf are enforced when present.
 *
 * Without a secret the strategy refuses to start in production and
 * accepts every token elsewhere with the dev identity.
 */
class JwtStrategy : public AuthStrategy {
public:
    using Clock = std::function<int64_t()>;   // seconds since the epoch

    // Throws core::McpError(ConfigurationError) when production has no secret
    explicit JwtStrategy(JwtStrategyOptions options, Clock clock = systemClock());

    AuthInfo verify(const std::string& token) const override;

    bool verificationBypassed() const { return !m_options.secretKey; }

    static Clock systemClock();

private:
    AuthInfo verifySigned(const std::string& token) const;

    JwtStrategyOptions m_options;
    Clock m_clock;
};

} // namespace auth
} // namespace gitmcp
