#pragma once

#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gitmcp {
namespace transport {

using json = nlohmann::json;

// Header names used by the Streamable HTTP transport
constexpr const char* kSessionIdHeader = "Mcp-Session-Id";
constexpr const char* kProtocolVersionHeader = "MCP-Protocol-Version";

/**
 * HTTP header collection with case-insensitive lookup.
 * The spelling of the last set() is kept for output.
 */
class Headers {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }

    // (name, value) pairs in lowercase-name order
    std::vector<std::pair<std::string, std::string>> entries() const;

private:
    // lowercase name -> (original name, value)
    std::map<std::string, std::pair<std::string, std::string>> m_entries;
};

/**
 * Framework-neutral view of one inbound HTTP request
 */
struct HttpRequest {
    std::string method;   // upper case: GET, POST, DELETE, OPTIONS
    std::string path;     // target without the query string
    Headers headers;
    std::string body;
};

/**
 * Pull-based byte stream used for responses that must not be buffered.
 * nextChunk() returns std::nullopt once the stream is exhausted.
 */
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    virtual std::string contentType() const = 0;
    virtual std::optional<std::string> nextChunk() = 0;
};

/**
 * Server-Sent Events framing of JSON-RPC messages:
 * "event: message\ndata: <json>\n\n" per message
 */
class SseMessageStream : public ResponseStream {
public:
    SseMessageStream() = default;
    explicit SseMessageStream(const std::vector<json>& messages);

    void push(const json& message);

    std::string contentType() const override { return "text/event-stream"; }
    std::optional<std::string> nextChunk() override;

private:
    std::mutex m_mutex;
    std::deque<std::string> m_frames;
};

/**
 * Result of handling one request, independent of the HTTP framework.
 * The payload variant holds either a buffered JSON body or a stream,
 * never both. A null JSON body means "no body" (202/204).
 */
struct TransportResponse {
    unsigned statusCode = 200;
    Headers headers;
    std::variant<json, std::shared_ptr<ResponseStream>> payload;
    std::optional<std::string> sessionId;

    static TransportResponse withBody(unsigned status, json body);
    static TransportResponse noContent(unsigned status = 204);
    static TransportResponse withStream(unsigned status, std::shared_ptr<ResponseStream> stream);

    bool hasStream() const { return std::holds_alternative<std::shared_ptr<ResponseStream>>(payload); }
    const json* body() const { return std::get_if<json>(&payload); }
    std::shared_ptr<ResponseStream> stream() const;
};

// 404 returned whenever a supplied session id is unknown or expired
TransportResponse sessionExpiredResponse(const json& id = nullptr);

// Generic JSON-RPC error with the given HTTP status
TransportResponse jsonRpcErrorResponse(unsigned status, int code, const std::string& message,
                                       const json& id = nullptr, const json& data = nullptr);

} // namespace transport
} // namespace gitmcp
