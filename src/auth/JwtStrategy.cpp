#include "auth/JwtStrategy.hpp"
#include "auth/JwtCodec.hpp"
#include "core/McpError.hpp"
#include "core/RequestContext.hpp"
#include "server/Logger.hpp"
#include <chrono>
#include <sstream>

namespace gitmcp {
namespace auth {

using core::JsonRpcErrorCode;
using core::McpError;
using json = nlohmann::json;

namespace {

const char* kVerificationFailed = "Token verification failed.";

std::optional<std::string> stringClaim(const json& payload, const char* name) {
    auto it = payload.find(name);
    if (it != payload.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> scopesFrom(const json& payload) {
    std::vector<std::string> scopes;

    auto scp = payload.find("scp");
    if (scp != payload.end() && scp->is_array()) {
        bool allStrings = true;
        for (const auto& s : *scp) {
            allStrings = allStrings && s.is_string();
        }
        if (allStrings) {
            for (const auto& s : *scp) {
                scopes.push_back(s.get<std::string>());
            }
            return scopes;
        }
    }

    if (auto scope = stringClaim(payload, "scope")) {
        std::istringstream words(*scope);
        std::string word;
        while (words >> word) {
            scopes.push_back(word);
        }
    }
    return scopes;
}

} // anonymous namespace

JwtStrategy::Clock JwtStrategy::systemClock() {
    return []() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    };
}

JwtStrategy::JwtStrategy(JwtStrategyOptions options, Clock clock)
    : m_options(std::move(options))
    , m_clock(std::move(clock))
{
    auto ctx = core::RequestContext::create("JwtStrategy.constructor");

    if (m_options.secretKey && m_options.secretKey->empty()) {
        m_options.secretKey.reset();
    }

    if (!m_options.secretKey) {
        if (m_options.environment == "production") {
            LOG_ERROR_CTX("MCP_AUTH_SECRET_KEY is not set in production for JWT auth", ctx);
            throw McpError(JsonRpcErrorCode::ConfigurationError,
                           "MCP_AUTH_SECRET_KEY must be set for JWT auth in production.");
        }
        LOG_WARN_CTX("MCP_AUTH_SECRET_KEY is not set. JWT auth will be bypassed (DEV ONLY).", ctx);
    } else {
        LOG_INFO_CTX("JWT secret key loaded", ctx);
    }
}

AuthInfo JwtStrategy::verify(const std::string& token) const {
    if (!m_options.secretKey) {
        LOG_WARN_CTX("Bypassing JWT verification: no secret key (DEV ONLY)",
                     core::RequestContext::create("JwtStrategy.verify"));
        AuthInfo info;
        info.token = "dev-mode-placeholder-token";
        info.clientId = m_options.devClientId;
        info.scopes = m_options.devScopes;
        return info;
    }
    return verifySigned(token);
}

AuthInfo JwtStrategy::verifySigned(const std::string& token) const {
    auto ctx = core::RequestContext::create("JwtStrategy.verify");

    auto decoded = jwt::decode(token);
    if (!decoded) {
        LOG_WARN_CTX("JWT verification failed: malformed token", ctx);
        throw McpError(JsonRpcErrorCode::Unauthorized, kVerificationFailed);
    }

    // The secret is symmetric; any other alg (including "none") is refused
    if (stringClaim(decoded->header, "alg") != std::optional<std::string>("HS256")) {
        LOG_WARN_CTX("JWT verification failed: unsupported alg", ctx);
        throw McpError(JsonRpcErrorCode::Unauthorized, kVerificationFailed);
    }

    if (!jwt::verifyHs256(*decoded, *m_options.secretKey)) {
        LOG_WARN_CTX("JWT verification failed: bad signature", ctx);
        throw McpError(JsonRpcErrorCode::Unauthorized, kVerificationFailed);
    }

    const json& claims = decoded->payload;
    int64_t now = m_clock();

    if (claims.contains("exp")) {
        if (!claims["exp"].is_number()) {
            throw McpError(JsonRpcErrorCode::Unauthorized, kVerificationFailed);
        }
        if (claims["exp"].get<double>() <= static_cast<double>(now)) {
            LOG_WARN_CTX("JWT verification failed: Token has expired.", ctx);
            throw McpError(JsonRpcErrorCode::Unauthorized, "Token has expired.");
        }
    }
    if (claims.contains("nbf")) {
        if (!claims["nbf"].is_number() || claims["nbf"].get<double>() > static_cast<double>(now)) {
            LOG_WARN_CTX("JWT verification failed: token not yet valid", ctx);
            throw McpError(JsonRpcErrorCode::Unauthorized, kVerificationFailed);
        }
    }

    auto clientId = stringClaim(claims, "cid");
    if (!clientId) {
        clientId = stringClaim(claims, "client_id");
    }
    if (!clientId) {
        LOG_WARN_CTX("Invalid token: missing 'cid' or 'client_id' claim.", ctx);
        throw McpError(JsonRpcErrorCode::Unauthorized, "Invalid token: missing 'cid' or 'client_id' claim.");
    }

    AuthInfo info;
    info.token = token;
    info.clientId = *clientId;
    info.scopes = scopesFrom(claims);
    if (info.scopes.empty()) {
        LOG_WARN_CTX("Invalid token: missing or empty 'scp' or 'scope' claim.", ctx);
        throw McpError(JsonRpcErrorCode::Unauthorized, "Token must contain valid, non-empty scopes.");
    }
    info.tenantId = stringClaim(claims, "tid");
    info.subject = stringClaim(claims, "sub");

    LOG_DEBUG_CTX("JWT verification successful", ctx.withField("clientId", info.clientId));
    return info;
}

} // namespace auth
} // namespace gitmcp
