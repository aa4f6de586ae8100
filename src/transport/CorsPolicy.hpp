#pragma once

#include "transport/TransportTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace transport {

/**
 * Origin allow-list for the MCP endpoint.
 * An empty list or a "*" entry allows every origin.
 */
class CorsPolicy {
public:
    CorsPolicy() = default;
    explicit CorsPolicy(std::vector<std::string> allowedOrigins);

    bool allowsAnyOrigin() const { return m_allowAny; }

    // Requests without an Origin header (non-browser clients) are always allowed
    bool isOriginAllowed(const std::optional<std::string>& origin) const;

    /**
     * Add Access-Control-* headers for an allowed request. The origin is
     * echoed back unless the policy is a bare wildcard and no origin was sent.
     */
    void applyHeaders(const std::optional<std::string>& origin, Headers& headers) const;

    static const char* allowedMethods();
    static const char* allowedHeaders();
    static const char* exposedHeaders();

private:
    std::vector<std::string> m_allowedOrigins;
    bool m_allowAny = true;
};

} // namespace transport
} // namespace gitmcp
