#include "transport/StdioTransport.hpp"
#include "transport/HttpErrorHandler.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"
#include <string>

namespace gitmcp {
namespace transport {

using core::JsonRpcErrorCode;

StdioTransport::StdioTransport(mcp::ProtocolHandlerPtr handler, std::istream& in, std::ostream& out,
                               const std::atomic<bool>* stopFlag)
    : m_handler(std::move(handler))
    , m_in(in)
    , m_out(out)
    , m_externalStop(stopFlag)
{
    if (!m_handler) {
        throw std::invalid_argument("StdioTransport requires a protocol handler");
    }
}

std::string StdioTransport::processLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    auto ctx = core::RequestContext::create("StdioTransport.processLine");

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        LOG_WARN_CTX("Invalid JSON on stdin", ctx.withField("error", e.what()));
        return core::makeJsonRpcError(JsonRpcErrorCode::ParseError, "Parse error").dump();
    }

    try {
        json result = m_handler->handle(message, ctx);
        return result.is_null() ? std::string() : result.dump();
    } catch (const std::exception& e) {
        LOG_ERROR_CTX("Protocol handler failed", ctx.withField("error", e.what()));
        return core::makeJsonRpcError(JsonRpcErrorCode::InternalError, "Internal error",
                                      HttpErrorHandler::extractRequestId(message)).dump();
    }
}

bool StdioTransport::stopRequested() const {
    return m_stopped || (m_externalStop && m_externalStop->load());
}

size_t StdioTransport::run() {
    LOG_INFO("Stdio transport started");

    size_t processed = 0;
    std::string line;
    while (!stopRequested() && std::getline(m_in, line)) {
        std::string response = processLine(line);
        if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
            ++processed;
        }
        if (!response.empty()) {
            m_out << response << '\n';
            m_out.flush();
        }
    }

    m_handler->close();
    LOG_INFO("Stdio transport stopped after " + std::to_string(processed) + " message(s)");
    return processed;
}

} // namespace transport
} // namespace gitmcp
