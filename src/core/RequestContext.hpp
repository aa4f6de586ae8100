#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace core {

using json = nlohmann::json;

/**
 * Per-request context threaded explicitly through every call from the HTTP
 * layer down to tool execution.
 *
 * Values are immutable: each with*() returns an extended copy and leaves the
 * receiver untouched, so concurrent requests never share mutable context.
 */
class RequestContext {
public:
    /**
     * New root context with a fresh request id and the current timestamp
     */
    static RequestContext create(const std::string& operation);

    const std::string& requestId() const { return m_requestId; }
    const std::string& timestamp() const { return m_timestamp; }
    const std::string& operation() const { return m_operation; }
    const std::optional<std::string>& sessionId() const { return m_sessionId; }
    const std::optional<std::string>& tenantId() const { return m_tenantId; }
    const std::optional<std::string>& clientId() const { return m_clientId; }
    const std::optional<std::string>& subject() const { return m_subject; }
    const std::vector<std::string>& scopes() const { return m_scopes; }
    bool isAuthenticated() const { return m_authenticated; }

    // Free-form fields for logging; null if none were added
    const json& fields() const { return m_fields; }

    RequestContext withOperation(const std::string& operation) const;
    RequestContext withSessionId(const std::string& sessionId) const;
    RequestContext withTenantId(const std::string& tenantId) const;
    RequestContext withAuth(const std::string& clientId,
                            const std::optional<std::string>& tenantId,
                            const std::optional<std::string>& subject,
                            const std::vector<std::string>& scopes) const;
    RequestContext withField(const std::string& key, json value) const;

    json toJson() const;

private:
    RequestContext() = default;

    std::string m_requestId;
    std::string m_timestamp;
    std::string m_operation;
    std::optional<std::string> m_sessionId;
    std::optional<std::string> m_tenantId;
    std::optional<std::string> m_clientId;
    std::optional<std::string> m_subject;
    std::vector<std::string> m_scopes;
    bool m_authenticated = false;
    json m_fields;
};

} // namespace core
} // namespace gitmcp
