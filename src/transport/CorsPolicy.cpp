#include "transport/CorsPolicy.hpp"
#include <algorithm>

namespace gitmcp {
namespace transport {

CorsPolicy::CorsPolicy(std::vector<std::string> allowedOrigins)
    : m_allowedOrigins(std::move(allowedOrigins))
{
    m_allowAny = m_allowedOrigins.empty()
        || std::find(m_allowedOrigins.begin(), m_allowedOrigins.end(), "*") != m_allowedOrigins.end();
}

const char* CorsPolicy::allowedMethods() {
    return "GET, POST, DELETE, OPTIONS";
}

const char* CorsPolicy::allowedHeaders() {
    return "Content-Type, Authorization, Mcp-Session-Id, MCP-Protocol-Version, Last-Event-ID";
}

const char* CorsPolicy::exposedHeaders() {
    return "Mcp-Session-Id";
}

bool CorsPolicy::isOriginAllowed(const std::optional<std::string>& origin) const {
    if (!origin || origin->empty() || m_allowAny) {
        return true;
    }
    return std::find(m_allowedOrigins.begin(), m_allowedOrigins.end(), *origin) != m_allowedOrigins.end();
}

void CorsPolicy::applyHeaders(const std::optional<std::string>& origin, Headers& headers) const {
    if (origin && !origin->empty()) {
        headers.set("Access-Control-Allow-Origin", *origin);
        headers.set("Access-Control-Allow-Credentials", "true");
        headers.set("Vary", "Origin");
    } else {
        headers.set("Access-Control-Allow-Origin", "*");
    }
    headers.set("Access-Control-Allow-Methods", allowedMethods());
    headers.set("Access-Control-Allow-Headers", allowedHeaders());
    headers.set("Access-Control-Expose-Headers", exposedHeaders());
}

} // namespace transport
} // namespace gitmcp
