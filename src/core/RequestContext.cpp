#include "core/RequestContext.hpp"
#include "core/IdGenerator.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gitmcp {
namespace core {

namespace {

// ISO 8601 UTC with milliseconds
std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // anonymous namespace

RequestContext RequestContext::create(const std::string& operation) {
    RequestContext ctx;
    ctx.m_requestId = IdGenerator::generateRequestId();
    ctx.m_timestamp = isoTimestamp();
    ctx.m_operation = operation;
    return ctx;
}

RequestContext RequestContext::withOperation(const std::string& operation) const {
    RequestContext copy(*this);
    copy.m_operation = operation;
    return copy;
}

RequestContext RequestContext::withSessionId(const std::string& sessionId) const {
    RequestContext copy(*this);
    copy.m_sessionId = sessionId;
    return copy;
}

RequestContext RequestContext::withTenantId(const std::string& tenantId) const {
    RequestContext copy(*this);
    copy.m_tenantId = tenantId;
    return copy;
}

RequestContext RequestContext::withAuth(const std::string& clientId,
                                        const std::optional<std::string>& tenantId,
                                        const std::optional<std::string>& subject,
                                        const std::vector<std::string>& scopes) const {
    RequestContext copy(*this);
    copy.m_clientId = clientId;
    if (tenantId) {
        copy.m_tenantId = tenantId;
    }
    copy.m_subject = subject;
    copy.m_scopes = scopes;
    copy.m_authenticated = true;
    return copy;
}

RequestContext RequestContext::withField(const std::string& key, json value) const {
    RequestContext copy(*this);
    if (!copy.m_fields.is_object()) {
        copy.m_fields = json::object();
    }
    copy.m_fields[key] = std::move(value);
    return copy;
}

json RequestContext::toJson() const {
    json out = {
        {"requestId", m_requestId},
        {"timestamp", m_timestamp}
    };
    if (!m_operation.empty()) out["operation"] = m_operation;
    if (m_sessionId) out["sessionId"] = *m_sessionId;
    if (m_tenantId) out["tenantId"] = *m_tenantId;
    if (m_clientId) out["clientId"] = *m_clientId;
    if (m_subject) out["subject"] = *m_subject;
    if (!m_scopes.empty()) out["scopes"] = m_scopes;
    if (m_fields.is_object()) {
        for (auto it = m_fields.begin(); it != m_fields.end(); ++it) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

} // namespace core
} // namespace gitmcp
