#include "transport/TransportTypes.hpp"
#include "core/McpError.hpp"
#include <algorithm>
#include <cctype>

namespace gitmcp {
namespace transport {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

void Headers::set(const std::string& name, const std::string& value) {
    m_entries[toLower(name)] = {name, value};
}

std::optional<std::string> Headers::get(const std::string& name) const {
    auto it = m_entries.find(toLower(name));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.second;
}

bool Headers::has(const std::string& name) const {
    return m_entries.count(toLower(name)) > 0;
}

void Headers::remove(const std::string& name) {
    m_entries.erase(toLower(name));
}

std::vector<std::pair<std::string, std::string>> Headers::entries() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        out.push_back(entry);
    }
    return out;
}

// =============================================================================
// SseMessageStream
// =============================================================================

SseMessageStream::SseMessageStream(const std::vector<json>& messages) {
    for (const auto& message : messages) {
        push(message);
    }
}

void SseMessageStream::push(const json& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frames.push_back("event: message\ndata: " + message.dump() + "\n\n");
}

std::optional<std::string> SseMessageStream::nextChunk() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frames.empty()) {
        return std::nullopt;
    }
    std::string frame = std::move(m_frames.front());
    m_frames.pop_front();
    return frame;
}

// =============================================================================
// TransportResponse
// =============================================================================

TransportResponse TransportResponse::withBody(unsigned status, json body) {
    TransportResponse res;
    res.statusCode = status;
    res.headers.set("Content-Type", "application/json");
    res.payload = std::move(body);
    return res;
}

TransportResponse TransportResponse::noContent(unsigned status) {
    TransportResponse res;
    res.statusCode = status;
    res.payload = json(nullptr);
    return res;
}

TransportResponse TransportResponse::withStream(unsigned status, std::shared_ptr<ResponseStream> stream) {
    TransportResponse res;
    res.statusCode = status;
    res.headers.set("Content-Type", stream->contentType());
    res.headers.set("Cache-Control", "no-cache");
    res.payload = std::move(stream);
    return res;
}

std::shared_ptr<ResponseStream> TransportResponse::stream() const {
    if (auto p = std::get_if<std::shared_ptr<ResponseStream>>(&payload)) {
        return *p;
    }
    return nullptr;
}

TransportResponse sessionExpiredResponse(const json& id) {
    return TransportResponse::withBody(
        404,
        core::makeJsonRpcError(core::JsonRpcErrorCode::NotFound,
                               "Session expired or invalid. Please reinitialize.", id));
}

TransportResponse jsonRpcErrorResponse(unsigned status, int code, const std::string& message,
                                       const json& id, const json& data) {
    json err = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        err["data"] = data;
    }
    return TransportResponse::withBody(
        status, json{{"jsonrpc", "2.0"}, {"error", err}, {"id", id}});
}

} // namespace transport
} // namespace gitmcp
