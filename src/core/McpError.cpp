#include "core/McpError.hpp"

namespace gitmcp {
namespace core {

std::string errorCodeName(JsonRpcErrorCode code) {
    switch (code) {
        case JsonRpcErrorCode::ParseError: return "ParseError";
        case JsonRpcErrorCode::InvalidRequest: return "InvalidRequest";
        case JsonRpcErrorCode::MethodNotFound: return "MethodNotFound";
        case JsonRpcErrorCode::InvalidParams: return "InvalidParams";
        case JsonRpcErrorCode::InternalError: return "InternalError";
        case JsonRpcErrorCode::ServiceUnavailable: return "ServiceUnavailable";
        case JsonRpcErrorCode::NotFound: return "NotFound";
        case JsonRpcErrorCode::Conflict: return "Conflict";
        case JsonRpcErrorCode::RateLimited: return "RateLimited";
        case JsonRpcErrorCode::Timeout: return "Timeout";
        case JsonRpcErrorCode::Forbidden: return "Forbidden";
        case JsonRpcErrorCode::Unauthorized: return "Unauthorized";
        case JsonRpcErrorCode::ValidationError: return "ValidationError";
        case JsonRpcErrorCode::ConfigurationError: return "ConfigurationError";
        case JsonRpcErrorCode::InitializationFailed: return "InitializationFailed";
        case JsonRpcErrorCode::UnknownError: return "UnknownError";
    }
    return "UnknownError";
}

McpError::McpError(JsonRpcErrorCode code, const std::string& message, json data)
    : std::runtime_error(message)
    , m_code(code)
    , m_data(std::move(data))
{
}

json McpError::toJson() const {
    json err = {
        {"code", numericCode()},
        {"message", what()}
    };
    if (!m_data.is_null()) {
        err["data"] = m_data;
    }
    return err;
}

json makeJsonRpcError(JsonRpcErrorCode code, const std::string& message,
                      const json& id, const json& data) {
    json err = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        err["data"] = data;
    }
    return json{
        {"jsonrpc", "2.0"},
        {"error", err},
        {"id", id}
    };
}

} // namespace core
} // namespace gitmcp
