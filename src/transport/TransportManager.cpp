#include "transport/TransportManager.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace gitmcp {
namespace transport {

TransportManager::TransportManager(mcp::ProtocolHandlerFactory factory)
    : m_factory(std::move(factory))
{
    if (!m_factory) {
        throw std::invalid_argument("TransportManager requires a protocol handler factory");
    }
}

TransportResponse TransportManager::makeResponse(const json& result, const Headers& requestHeaders) const {
    if (result.is_null()) {
        return TransportResponse::noContent(204);
    }

    auto accept = requestHeaders.get("Accept");
    if (m_sseResponses && accept && accept->find("text/event-stream") != std::string::npos) {
        auto stream = std::make_shared<SseMessageStream>();
        if (result.is_array()) {
            for (const auto& message : result) {
                stream->push(message);
            }
        } else {
            stream->push(result);
        }
        return TransportResponse::withStream(200, stream);
    }

    return TransportResponse::withBody(200, result);
}

HandlerCloseGuard::~HandlerCloseGuard() {
    if (!m_handler) return;
    try {
        m_handler->close();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Failed to close protocol handler: ") + e.what());
    }
}

} // namespace transport
} // namespace gitmcp
