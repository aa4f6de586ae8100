#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace gitmcp {
namespace core {

using json = nlohmann::json;

/**
 * JSON-RPC 2.0 error codes: the standard set plus the server range (-32000..-32099)
 */
enum class JsonRpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    ServiceUnavailable = -32000,
    NotFound = -32001,
    Conflict = -32002,
    RateLimited = -32003,
    Timeout = -32004,
    Forbidden = -32005,
    Unauthorized = -32006,
    ValidationError = -32007,
    ConfigurationError = -32008,
    InitializationFailed = -32009,
    UnknownError = -32099
};

std::string errorCodeName(JsonRpcErrorCode code);

/**
 * Error raised anywhere in the server with a protocol-visible code.
 * The message is considered safe to return to clients; data is optional
 * structured detail that also goes on the wire.
 */
class McpError : public std::runtime_error {
public:
    McpError(JsonRpcErrorCode code, const std::string& message, json data = nullptr);

    JsonRpcErrorCode code() const { return m_code; }
    int numericCode() const { return static_cast<int>(m_code); }
    const json& data() const { return m_data; }

    // {"code": ..., "message": ..., "data"?: ...}
    json toJson() const;

private:
    JsonRpcErrorCode m_code;
    json m_data;
};

// Full JSON-RPC error envelope: {"jsonrpc":"2.0","error":{...},"id":id}
json makeJsonRpcError(JsonRpcErrorCode code, const std::string& message,
                      const json& id = nullptr, const json& data = nullptr);

} // namespace core
} // namespace gitmcp
